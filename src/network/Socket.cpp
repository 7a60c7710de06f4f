#include "swarmshare/network/Socket.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace swarmshare::network {

namespace {

void set_non_blocking(int socket, bool enable) {
    int flags = ::fcntl(socket, F_GETFL, 0);
    if (flags < 0) {
        return;
    }
    if (enable) {
        flags |= O_NONBLOCK;
    } else {
        flags &= ~O_NONBLOCK;
    }
    ::fcntl(socket, F_SETFL, flags);
}

std::optional<sockaddr_in> resolve(const std::string& host, std::uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* result = nullptr;
    if (const auto err = ::getaddrinfo(host.c_str(), nullptr, &hints, &result); err != 0 || result == nullptr) {
        if (result) {
            ::freeaddrinfo(result);
        }
        return std::nullopt;
    }
    sockaddr_in address = *reinterpret_cast<sockaddr_in*>(result->ai_addr);
    address.sin_port = htons(port);
    ::freeaddrinfo(result);
    return address;
}

}  // namespace

bool send_all(int socket, const std::uint8_t* data, std::size_t length) {
    std::size_t total = 0;
    while (total < length) {
        const auto sent = ::send(socket, data + total, length - total, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(sent);
    }
    return true;
}

bool recv_all(int socket, std::uint8_t* buffer, std::size_t length) {
    std::size_t total = 0;
    while (total < length) {
        const auto received = ::recv(socket, buffer + total, length - total, 0);
        if (received < 0 && errno == EINTR) {
            continue;
        }
        if (received <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(received);
    }
    return true;
}

std::optional<int> connect_tcp(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
    const auto address = resolve(host, port);
    if (!address) {
        return std::nullopt;
    }

    const int socket = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
    if (socket < 0) {
        return std::nullopt;
    }

    set_non_blocking(socket, true);
    if (::connect(socket, reinterpret_cast<const sockaddr*>(&*address), sizeof(*address)) != 0) {
        if (errno != EINPROGRESS) {
            ::close(socket);
            return std::nullopt;
        }
        pollfd descriptor{};
        descriptor.fd = socket;
        descriptor.events = POLLOUT;
        const auto ready = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
        int error = 0;
        socklen_t len = sizeof(error);
        if (ready <= 0 || ::getsockopt(socket, SOL_SOCKET, SO_ERROR, &error, &len) != 0 || error != 0) {
            ::close(socket);
            return std::nullopt;
        }
    }
    set_non_blocking(socket, false);

    int nodelay = 1;
    ::setsockopt(socket, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
    return socket;
}

std::optional<std::pair<int, std::uint16_t>> listen_tcp(const std::string& host, std::uint16_t port) {
    const int socket = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
    if (socket < 0) {
        return std::nullopt;
    }
    int enable = 1;
    ::setsockopt(socket, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &address.sin_addr) != 1 ||
        ::bind(socket, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) != 0 ||
        ::listen(socket, SOMAXCONN) != 0) {
        ::close(socket);
        return std::nullopt;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(socket, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
        ::close(socket);
        return std::nullopt;
    }
    return std::make_pair(socket, static_cast<std::uint16_t>(ntohs(bound.sin_port)));
}

bool set_recv_timeout(int socket, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return ::setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

void shutdown_socket(int socket) {
    if (socket != kInvalidSocket) {
        ::shutdown(socket, SHUT_RDWR);
    }
}

void close_socket(int socket) {
    if (socket != kInvalidSocket) {
        ::close(socket);
    }
}

std::optional<std::pair<std::string, std::uint16_t>> parse_endpoint(const std::string& text) {
    const auto pos = text.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= text.size()) {
        return std::nullopt;
    }
    std::uint32_t port = 0;
    const auto* begin = text.data() + pos + 1;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, port);
    if (ec != std::errc{} || ptr != end || port == 0 || port > 65535) {
        return std::nullopt;
    }
    return std::make_pair(text.substr(0, pos), static_cast<std::uint16_t>(port));
}

}  // namespace swarmshare::network
