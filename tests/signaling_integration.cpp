#include "swarmshare/coordinator/EventLoop.hpp"
#include "swarmshare/coordinator/FileRegistry.hpp"
#include "swarmshare/coordinator/SignalingServer.hpp"
#include "swarmshare/network/SignalingClient.hpp"
#include "swarmshare/network/Socket.hpp"
#include "swarmshare/protocol/Signal.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <numeric>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <sys/socket.h>

using namespace std::chrono_literals;

namespace {

class Inbox {
public:
    void push(const swarmshare::PushNotification& push) {
        std::scoped_lock lock(mutex_);
        pushes_.push_back(push);
        cv_.notify_all();
    }

    void relay(const swarmshare::RelayEnvelope& envelope) {
        std::scoped_lock lock(mutex_);
        relays_.push_back(envelope);
        cv_.notify_all();
    }

    bool wait_push(swarmshare::PushKind kind, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            for (const auto& push : pushes_) {
                if (push.kind == kind) {
                    return true;
                }
            }
            return false;
        });
    }

    std::optional<swarmshare::RelayEnvelope> wait_relay(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [&] { return !relays_.empty(); })) {
            return std::nullopt;
        }
        return relays_.front();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<swarmshare::PushNotification> pushes_;
    std::vector<swarmshare::RelayEnvelope> relays_;
};

// Reads one frame and reports whether it is a successful response.
bool read_ok_response(int socket) {
    swarmshare::protocol::FrameAssembler assembler;
    std::array<std::uint8_t, 512> buffer{};
    while (true) {
        if (auto frame = assembler.next()) {
            const auto message = swarmshare::protocol::decode(*frame);
            if (!message || message->type != swarmshare::protocol::SignalType::Response) {
                return false;
            }
            const auto* response = std::get_if<swarmshare::protocol::ResponsePayload>(&message->payload);
            return response != nullptr && response->code == swarmshare::ErrorCode::None;
        }
        const auto received = ::recv(socket, buffer.data(), buffer.size(), 0);
        if (received <= 0) {
            return false;
        }
        assembler.append(std::span<const std::uint8_t>(buffer.data(), static_cast<std::size_t>(received)));
    }
}

// True once the server has closed the stream; a receive timeout means it is still open.
bool drained_to_close(int socket) {
    std::array<std::uint8_t, 16 * 1024> buffer{};
    while (true) {
        const auto received = ::recv(socket, buffer.data(), buffer.size(), 0);
        if (received == 0) {
            return true;
        }
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno == ECONNRESET;
        }
    }
}

}  // namespace

int main() {
    swarmshare::Config config{};
    swarmshare::coordinator::EventLoop loop;
    swarmshare::coordinator::FileRegistry registry(config);

    swarmshare::coordinator::SignalingServerConfig server_config{};
    server_config.listen_host = "127.0.0.1";
    server_config.listen_port = 0;
    server_config.max_write_buffer_bytes = 2048;
    swarmshare::coordinator::SignalingServer server(loop, registry, server_config);
    server.set_authenticator([](const swarmshare::DeviceKey&, const std::string& token) { return token == "secret"; });
    if (!server.start()) {
        std::cerr << "[SignalingIntegration] server failed to start" << std::endl;
        return 1;
    }
    std::thread loop_thread([&loop]() { loop.run(); });

    const auto client_config = [&server](std::string token) {
        swarmshare::network::SignalingClientConfig result{};
        result.host = "127.0.0.1";
        result.port = server.listening_port();
        result.token = std::move(token);
        result.request_timeout = 2s;
        return result;
    };

    swarmshare::network::SignalingClient alice({"alice", "laptop"}, client_config("secret"));
    swarmshare::network::SignalingClient bob({"bob", "phone"}, client_config("secret"));
    swarmshare::network::SignalingClient mallory({"mallory", "laptop"}, client_config("wrong"));

    Inbox alice_inbox;
    Inbox bob_inbox;
    alice.set_relay_handler([&alice_inbox](const swarmshare::RelayEnvelope& envelope) { alice_inbox.relay(envelope); });
    bob.set_push_handler([&bob_inbox](const swarmshare::PushNotification& push) { bob_inbox.push(push); });

    auto shutdown = [&]() {
        alice.disconnect();
        bob.disconnect();
        mallory.disconnect();
        loop.stop();
        if (loop_thread.joinable()) {
            loop_thread.join();
        }
        server.stop();
    };

    auto require = [&](bool condition, const char* message) {
        if (!condition) {
            std::cerr << "[SignalingIntegration] " << message << std::endl;
            shutdown();
            return false;
        }
        return true;
    };

    if (!require(alice.connect().ok(), "alice failed to connect")) {
        return 1;
    }
    if (!require(bob.connect().ok(), "bob failed to connect")) {
        return 1;
    }
    const auto rejected = mallory.connect();
    if (!require(rejected.code == swarmshare::ErrorCode::AccessDenied, "bad token was accepted")) {
        return 1;
    }
    if (!require(!mallory.connected(), "rejected client stayed connected")) {
        return 1;
    }

    const swarmshare::FileId file_id = "be11be11be11be11be11be11be11be11";
    swarmshare::AnnounceRequest request{};
    request.file_id = file_id;
    request.file_size = 1048576;
    request.checksum = std::string(64, 'c');
    request.chunk_count = 16;
    request.available_chunks.resize(16);
    std::iota(request.available_chunks.begin(), request.available_chunks.end(), 0u);
    const auto announced = alice.announce(request);
    if (!require(announced.ok(), "announce failed")) {
        return 1;
    }

    const auto denied = bob.get_info(file_id);
    if (!require(denied.status.code == swarmshare::ErrorCode::AccessDenied, "outsider could read the record")) {
        return 1;
    }

    // Relays need both ends on the share list.
    swarmshare::RelayEnvelope offer{};
    offer.kind = swarmshare::RelayKind::Offer;
    offer.file_id = file_id;
    offer.to = {"alice", ""};
    offer.payload = "offer-body";
    if (!require(bob.relay(offer).code == swarmshare::ErrorCode::AccessDenied, "relay from outsider was forwarded")) {
        return 1;
    }

    const auto shared = alice.share_update(file_id, swarmshare::ShareAction::Add, {"bob"});
    if (!require(shared.ok() && shared.value->size() == 2, "share add failed")) {
        return 1;
    }
    if (!require(bob_inbox.wait_push(swarmshare::PushKind::FileAvailable, 2s), "bob never heard about the file")) {
        return 1;
    }

    const auto info = bob.get_info(file_id);
    if (!require(info.ok() && info.value->chunk_quality == 100, "member could not read the record")) {
        return 1;
    }
    const auto seeders = bob.list_seeders(file_id);
    if (!require(seeders.ok() && seeders.value->size() == 1, "seeder list wrong")) {
        return 1;
    }
    if (!require(bob.register_leecher(file_id, {}).ok(), "register leecher failed")) {
        return 1;
    }

    if (!require(bob.relay(offer).ok(), "relay between members failed")) {
        return 1;
    }
    const auto relayed = alice_inbox.wait_relay(2s);
    if (!require(relayed.has_value(), "relay never arrived")) {
        return 1;
    }
    if (!require(relayed->from.principal == "bob" && relayed->from.device == "phone", "relay sender not stamped")) {
        return 1;
    }
    if (!require(relayed->payload == "offer-body" && relayed->kind == swarmshare::RelayKind::Offer,
                 "relay payload altered")) {
        return 1;
    }

    const auto revoked = alice.share_update(file_id, swarmshare::ShareAction::Revoke, {"bob"});
    if (!require(revoked.ok(), "revoke failed")) {
        return 1;
    }
    if (!require(bob_inbox.wait_push(swarmshare::PushKind::AccessRevoked, 2s), "bob never learned of the revocation")) {
        return 1;
    }
    if (!require(bob.get_info(file_id).status.code == swarmshare::ErrorCode::AccessDenied, "revoked member still reads")) {
        return 1;
    }

    // A client that pipelines requests without reading replies is cut off once its backlog passes the cap.
    const auto flooder = swarmshare::network::connect_tcp("127.0.0.1", server.listening_port(), 2s);
    if (!require(flooder.has_value(), "flooding client could not connect")) {
        return 1;
    }
    swarmshare::network::set_recv_timeout(*flooder, 2s);
    swarmshare::protocol::SignalMessage hello{};
    hello.type = swarmshare::protocol::SignalType::Hello;
    hello.request_id = 1;
    hello.payload = swarmshare::protocol::HelloPayload{{"eve", "tablet"}, "secret"};
    const auto hello_frame = swarmshare::protocol::encode_frame(hello);
    const bool greeted = swarmshare::network::send_all(*flooder, hello_frame.data(), hello_frame.size()) &&
                         read_ok_response(*flooder);
    if (!greeted) {
        swarmshare::network::close_socket(*flooder);
    }
    if (!require(greeted, "flooding client was not admitted")) {
        return 1;
    }
    std::vector<std::uint8_t> burst;
    for (std::uint32_t id = 2; id < 2002; ++id) {
        swarmshare::protocol::SignalMessage query{};
        query.type = swarmshare::protocol::SignalType::GetInfo;
        query.request_id = id;
        query.payload = swarmshare::protocol::FileQueryPayload{file_id};
        const auto frame = swarmshare::protocol::encode_frame(query);
        burst.insert(burst.end(), frame.begin(), frame.end());
    }
    // The server may cut the stream before the whole burst is written.
    static_cast<void>(swarmshare::network::send_all(*flooder, burst.data(), burst.size()));
    const bool cut_off = drained_to_close(*flooder);
    swarmshare::network::close_socket(*flooder);
    if (!require(cut_off, "slow reader was never disconnected")) {
        return 1;
    }
    if (!require(alice.get_info(file_id).ok(), "other clients suffered from the slow reader")) {
        return 1;
    }

    if (!require(alice.unannounce(file_id).ok(), "unannounce failed")) {
        return 1;
    }
    if (!require(registry.size() == 0, "record survived the creator's unannounce")) {
        return 1;
    }

    shutdown();
    return 0;
}
