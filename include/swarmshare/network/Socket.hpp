#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace swarmshare::network {

inline constexpr int kInvalidSocket = -1;

// Blocking helpers shared by the signaling client and the peer transport. POSIX only.
bool send_all(int socket, const std::uint8_t* data, std::size_t length);
bool recv_all(int socket, std::uint8_t* buffer, std::size_t length);

// Connects with a bounded wait; the returned socket is blocking.
std::optional<int> connect_tcp(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout);

// Listens on host:port (port 0 picks one) and reports the bound port.
std::optional<std::pair<int, std::uint16_t>> listen_tcp(const std::string& host, std::uint16_t port);

bool set_recv_timeout(int socket, std::chrono::milliseconds timeout);
// Wakes any thread blocked on the socket without releasing the descriptor.
void shutdown_socket(int socket);
void close_socket(int socket);

std::optional<std::pair<std::string, std::uint16_t>> parse_endpoint(const std::string& text);

}  // namespace swarmshare::network
