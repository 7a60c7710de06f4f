#pragma once

#include "swarmshare/network/CoordinatorLink.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace swarmshare::network {

struct SignalingClientConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{9750};
    std::string token;
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds request_timeout{std::chrono::seconds(5)};
};

// TCP link to a SignalingServer. A reader thread correlates responses by request id and delivers
// pushes and relays.
class SignalingClient final : public CoordinatorLink {
public:
    SignalingClient(DeviceKey self, SignalingClientConfig config);
    ~SignalingClient() override;

    Status connect() override;
    void disconnect() override;
    [[nodiscard]] bool connected() const override { return connected_.load(); }

protected:
    Result<protocol::ResponsePayload> exchange(protocol::SignalMessage request) override;

private:
    using Pending = std::promise<protocol::ResponsePayload>;

    Result<protocol::ResponsePayload> send_and_wait(protocol::SignalMessage request);
    void reader_loop(int socket);
    // Resolves every waiter with a TRANSPORT_FAILURE response.
    void fail_pending();

    SignalingClientConfig config_;
    std::atomic<bool> connected_{false};
    std::atomic<std::uint32_t> next_request_id_{1};

    std::mutex connection_mutex_;
    int socket_{-1};
    std::thread reader_;

    std::mutex send_mutex_;

    std::mutex pending_mutex_;
    std::unordered_map<std::uint32_t, std::shared_ptr<Pending>> pending_;
};

}  // namespace swarmshare::network
