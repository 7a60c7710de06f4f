#include "swarmshare/coordinator/SignalingServer.hpp"

#include "swarmshare/logging/StructuredLogger.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace swarmshare::coordinator {

namespace {

using logging::StructuredLogger;
using logging::log_event;

constexpr std::size_t kReadChunk = 16 * 1024;

}  // namespace

SignalingServer::ClientSession::ClientSession(int socket_fd)
    : fd(socket_fd) {}

SignalingServer::SignalingServer(EventLoop& loop, FileRegistry& registry, SignalingServerConfig config)
    : loop_(loop),
      registry_(registry),
      router_(registry),
      config_(std::move(config)) {}

SignalingServer::~SignalingServer() {
    stop();
}

void SignalingServer::set_authenticator(Authenticator authenticator) {
    authenticator_ = std::move(authenticator);
}

bool SignalingServer::start() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        log_event(StructuredLogger::Level::Error, "signaling.socket_failed", {{"error", std::strerror(errno)}});
        return false;
    }

    int enable = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));
    configure_socket(listen_fd_);

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(config_.listen_port);
    if (::inet_pton(AF_INET, config_.listen_host.c_str(), &address.sin_addr) != 1) {
        log_event(StructuredLogger::Level::Error, "signaling.invalid_host", {{"host", config_.listen_host}});
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0 ||
        ::listen(listen_fd_, SOMAXCONN) != 0) {
        log_event(StructuredLogger::Level::Error,
                  "signaling.bind_failed",
                  {{"host", config_.listen_host},
                   {"port", std::to_string(config_.listen_port)},
                   {"error", std::strerror(errno)}});
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = config_.listen_port;
    }

    loop_.add(listen_fd_, EventLoop::kEventReadable, [this](int fd, std::uint32_t) {
        if (fd == listen_fd_) {
            accept_new_clients();
        }
    });
    sweep_timer_ = loop_.add_timer(config_.sweep_interval, [this]() { sweep(); });

    log_event(StructuredLogger::Level::Info,
              "signaling.listening",
              {{"host", config_.listen_host}, {"port", std::to_string(bound_port_)}});
    return true;
}

void SignalingServer::stop() {
    if (sweep_timer_ >= 0) {
        loop_.cancel_timer(sweep_timer_);
        sweep_timer_ = -1;
    }
    if (listen_fd_ >= 0) {
        loop_.remove(listen_fd_);
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    auto sessions = std::move(sessions_);
    sessions_.clear();
    for (auto& entry : sessions) {
        close_session(entry.second, "shutdown");
    }
    devices_.clear();
}

void SignalingServer::configure_socket(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
    int opts = ::fcntl(fd, F_GETFD, 0);
    if (opts >= 0) {
        ::fcntl(fd, F_SETFD, opts | FD_CLOEXEC);
    }
}

void SignalingServer::accept_new_clients() {
    while (true) {
        sockaddr_in remote{};
        socklen_t len = sizeof(remote);
        int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&remote), &len);
        if (client_fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                log_event(StructuredLogger::Level::Warning, "signaling.accept_failed", {{"error", std::strerror(errno)}});
            }
            break;
        }
        configure_socket(client_fd);
        int nodelay = 1;
        ::setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

        auto session = std::make_shared<ClientSession>(client_fd);
        sessions_.emplace(client_fd, session);
        loop_.add(client_fd,
                  EventLoop::kEventReadable,
                  [this, weak = std::weak_ptr<ClientSession>(session)](int fd, std::uint32_t events) {
                      auto locked = weak.lock();
                      if (!locked) {
                          loop_.remove(fd);
                          return;
                      }
                      on_client_event(locked, events);
                  });
    }
}

void SignalingServer::on_client_event(const std::shared_ptr<ClientSession>& session, std::uint32_t events) {
    if (events & EventLoop::kEventError) {
        close_session(session, "socket_error");
        return;
    }
    if ((events & EventLoop::kEventReadable) && !handle_read(session)) {
        return;
    }
    if (events & EventLoop::kEventWritable) {
        handle_write(session);
    }
}

bool SignalingServer::handle_read(const std::shared_ptr<ClientSession>& session) {
    std::array<std::uint8_t, kReadChunk> buffer{};
    while (true) {
        const auto received = ::recv(session->fd, buffer.data(), buffer.size(), 0);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            close_session(session, "read_error");
            return false;
        }
        if (received == 0) {
            close_session(session, "peer_closed");
            return false;
        }
        session->assembler.append(std::span<const std::uint8_t>(buffer.data(), static_cast<std::size_t>(received)));
        process_frames(session);
        if (session->closing) {
            return false;
        }
    }
    return true;
}

bool SignalingServer::handle_write(const std::shared_ptr<ClientSession>& session) {
    if (session->closing) {
        return false;
    }
    while (!session->write_buffer.empty()) {
        const auto sent = ::send(session->fd, session->write_buffer.data(), session->write_buffer.size(), MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            close_session(session, "write_error");
            return false;
        }
        session->write_buffer.erase(session->write_buffer.begin(), session->write_buffer.begin() + sent);
    }
    update_interest(session);
    return true;
}

void SignalingServer::process_frames(const std::shared_ptr<ClientSession>& session) {
    while (!session->closing) {
        auto frame = session->assembler.next();
        if (!frame) {
            if (session->assembler.overflowed()) {
                close_session(session, "frame_too_large");
            }
            break;
        }
        const auto message = protocol::decode(*frame);
        if (!message) {
            close_session(session, "malformed_frame");
            break;
        }
        if (!session->authenticated) {
            handle_hello(session, *message);
            continue;
        }
        if (message->type == protocol::SignalType::Hello) {
            queue_message(session,
                          protocol::make_response(message->request_id,
                                                  make_error(ErrorCode::InvalidArgument, "already identified")));
            continue;
        }
        queue_message(session, router_.handle(session->device, *message));
        flush_outbox();
    }
}

void SignalingServer::handle_hello(const std::shared_ptr<ClientSession>& session, const protocol::SignalMessage& message) {
    const auto* hello = std::get_if<protocol::HelloPayload>(&message.payload);
    if (message.type != protocol::SignalType::Hello || hello == nullptr || hello->device.principal.empty() ||
        hello->device.device.empty()) {
        queue_message(session,
                      protocol::make_response(message.request_id,
                                              make_error(ErrorCode::InvalidArgument, "hello required")));
        handle_write(session);
        close_session(session, "missing_hello");
        return;
    }
    if (authenticator_ && !authenticator_(hello->device, hello->token)) {
        queue_message(session,
                      protocol::make_response(message.request_id, make_error(ErrorCode::AccessDenied, "access denied")));
        handle_write(session);
        close_session(session, "unauthenticated");
        return;
    }

    // A reconnecting device replaces its previous session.
    const auto existing = devices_.find(hello->device);
    if (existing != devices_.end()) {
        if (auto previous = existing->second.lock(); previous && previous != session) {
            close_session(previous, "replaced");
        }
    }

    session->device = hello->device;
    session->authenticated = true;
    devices_[session->device] = session;
    router_.connect(session->device);
    log_event(StructuredLogger::Level::Info,
              "signaling.client_connected",
              {{"device", device_key_to_string(session->device)}});
    queue_message(session, protocol::make_response(message.request_id, make_ok()));
}

void SignalingServer::queue_message(const std::shared_ptr<ClientSession>& session,
                                    const protocol::SignalMessage& message) {
    if (session->closing) {
        return;
    }
    const auto frame = protocol::encode_frame(message);
    const bool backlogged = !session->write_buffer.empty();
    session->write_buffer.insert(session->write_buffer.end(), frame.begin(), frame.end());
    // A single oversized frame is allowed through; a backlog that keeps growing is not.
    if (backlogged && session->write_buffer.size() > config_.max_write_buffer_bytes) {
        log_event(StructuredLogger::Level::Warning,
                  "signaling.slow_consumer",
                  {{"device", device_key_to_string(session->device)},
                   {"buffered", std::to_string(session->write_buffer.size())}});
        close_session(session, "slow_consumer");
        return;
    }
    update_interest(session);
}

void SignalingServer::update_interest(const std::shared_ptr<ClientSession>& session) {
    if (session->closing) {
        return;
    }
    std::uint32_t mask = EventLoop::kEventReadable;
    if (!session->write_buffer.empty()) {
        mask |= EventLoop::kEventWritable;
    }
    loop_.update(session->fd, mask);
}

void SignalingServer::flush_outbox() {
    for (auto& outbound : router_.take_outbox()) {
        const auto it = devices_.find(outbound.target);
        if (it == devices_.end()) {
            continue;
        }
        if (auto target = it->second.lock()) {
            queue_message(target, outbound.message);
        }
    }
}

void SignalingServer::sweep() {
    const auto removed = registry_.sweep_expired();
    if (removed > 0) {
        flush_outbox();
    }
}

void SignalingServer::close_session(const std::shared_ptr<ClientSession>& session, const char* reason) {
    if (session->closing) {
        return;
    }
    session->closing = true;
    loop_.remove(session->fd);
    ::close(session->fd);
    sessions_.erase(session->fd);

    if (session->authenticated) {
        const auto it = devices_.find(session->device);
        if (it != devices_.end() && it->second.lock() == session) {
            devices_.erase(it);
        }
        router_.disconnect(session->device);
        // Roster changes may have produced pushes for the remaining devices.
        flush_outbox();
    }
    log_event(StructuredLogger::Level::Info,
              "signaling.client_closed",
              {{"device", session->authenticated ? device_key_to_string(session->device) : std::string("anonymous")},
               {"reason", reason}});
}

}  // namespace swarmshare::coordinator
