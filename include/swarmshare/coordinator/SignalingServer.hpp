#pragma once

#include "swarmshare/Config.hpp"
#include "swarmshare/Types.hpp"
#include "swarmshare/coordinator/EventLoop.hpp"
#include "swarmshare/coordinator/FileRegistry.hpp"
#include "swarmshare/coordinator/SignalRouter.hpp"
#include "swarmshare/protocol/Signal.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace swarmshare::coordinator {

struct SignalingServerConfig {
    std::string listen_host{"0.0.0.0"};
    std::uint16_t listen_port{9750};
    std::chrono::milliseconds sweep_interval{std::chrono::hours(1)};
    // A client whose unsent backlog grows past this is disconnected.
    std::size_t max_write_buffer_bytes{4 * 1024 * 1024};
};

// Persistent signaling channel, one TCP connection per online device. Runs entirely on the
// event loop thread.
class SignalingServer {
public:
    // Session authentication is external; the hook only decides whether a Hello token is acceptable.
    using Authenticator = std::function<bool(const DeviceKey& device, const std::string& token)>;

    SignalingServer(EventLoop& loop, FileRegistry& registry, SignalingServerConfig config);
    ~SignalingServer();

    SignalingServer(const SignalingServer&) = delete;
    SignalingServer& operator=(const SignalingServer&) = delete;

    void set_authenticator(Authenticator authenticator);

    bool start();
    void stop();

    // Bound port; differs from the configured one when that was 0.
    [[nodiscard]] std::uint16_t listening_port() const noexcept { return bound_port_; }

private:
    struct ClientSession {
        explicit ClientSession(int fd);

        int fd{-1};
        protocol::FrameAssembler assembler;
        std::vector<std::uint8_t> write_buffer;
        DeviceKey device;
        bool authenticated{false};
        bool closing{false};
    };

    void configure_socket(int fd);
    void accept_new_clients();
    void on_client_event(const std::shared_ptr<ClientSession>& session, std::uint32_t events);
    bool handle_read(const std::shared_ptr<ClientSession>& session);
    bool handle_write(const std::shared_ptr<ClientSession>& session);
    void process_frames(const std::shared_ptr<ClientSession>& session);
    void handle_hello(const std::shared_ptr<ClientSession>& session, const protocol::SignalMessage& message);

    void queue_message(const std::shared_ptr<ClientSession>& session, const protocol::SignalMessage& message);
    void update_interest(const std::shared_ptr<ClientSession>& session);
    void flush_outbox();
    void sweep();
    void close_session(const std::shared_ptr<ClientSession>& session, const char* reason);

    EventLoop& loop_;
    FileRegistry& registry_;
    SignalRouter router_;
    SignalingServerConfig config_{};
    Authenticator authenticator_;
    int listen_fd_{-1};
    std::uint16_t bound_port_{0};
    EventLoop::TimerId sweep_timer_{-1};

    std::unordered_map<int, std::shared_ptr<ClientSession>> sessions_;
    std::map<DeviceKey, std::weak_ptr<ClientSession>> devices_;
};

}  // namespace swarmshare::coordinator
