#include "swarmshare/coordinator/FileRegistry.hpp"
#include "swarmshare/coordinator/LocalHub.hpp"
#include "swarmshare/crypto/EncryptionService.hpp"
#include "swarmshare/network/Socket.hpp"
#include "swarmshare/transport/TransportLayer.hpp"

#include <chrono>
#include <condition_variable>
#include <iostream>
#include <map>
#include <mutex>
#include <numeric>
#include <string>
#include <variant>
#include <vector>

using namespace std::chrono_literals;

namespace {

using swarmshare::transport::ChannelKey;

class Observer {
public:
    void on_connection(const ChannelKey& key, bool connected) {
        std::scoped_lock lock(mutex_);
        states_[key] = connected;
        cv_.notify_all();
    }

    void on_message(const ChannelKey& key, swarmshare::protocol::PeerMessage message) {
        std::scoped_lock lock(mutex_);
        messages_.emplace_back(key, std::move(message));
        cv_.notify_all();
    }

    bool wait_state(const ChannelKey& key, bool connected, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            const auto it = states_.find(key);
            return it != states_.end() && it->second == connected;
        });
    }

    bool wait_messages(std::size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return messages_.size() >= count; });
    }

    std::pair<ChannelKey, swarmshare::protocol::PeerMessage> message(std::size_t index) {
        std::scoped_lock lock(mutex_);
        return messages_.at(index);
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<ChannelKey, bool> states_;
    std::vector<std::pair<ChannelKey, swarmshare::protocol::PeerMessage>> messages_;
};

swarmshare::AnnounceRequest announce_for(const swarmshare::FileId& file_id, std::vector<swarmshare::PrincipalId> members) {
    swarmshare::AnnounceRequest request{};
    request.file_id = file_id;
    request.file_size = 70000;
    request.checksum = std::string(64, '1');
    request.chunk_count = 2;
    request.available_chunks = {0, 1};
    request.shared_with = std::move(members);
    return request;
}

}  // namespace

int main() {
    const swarmshare::DeviceKey alice{"alice", "laptop"};
    const swarmshare::DeviceKey bob{"bob", "phone"};
    const swarmshare::FileId shared_file = "5ea1ed005ea1ed005ea1ed005ea1ed00";
    const swarmshare::FileId private_file = "0b5c0e000b5c0e000b5c0e000b5c0e00";

    swarmshare::coordinator::FileRegistry registry;
    swarmshare::coordinator::LocalHub hub(registry);
    auto alice_link = hub.make_link(alice);
    auto bob_link = hub.make_link(bob);

    swarmshare::transport::TransportConfig config{};
    config.listen_host = "127.0.0.1";
    config.advertised_host = "127.0.0.1";
    config.connect_timeout = 2s;
    swarmshare::transport::TransportLayer alice_transport(*alice_link, config);
    swarmshare::transport::TransportLayer bob_transport(*bob_link, config);

    Observer alice_events;
    Observer bob_events;
    const auto admit = [&registry](const swarmshare::DeviceKey& peer, const swarmshare::FileId& file_id) {
        return registry.can_access(peer.principal, file_id);
    };
    alice_transport.set_admission_hook(admit);
    bob_transport.set_admission_hook(admit);
    alice_transport.set_connection_handler(
        [&alice_events](const ChannelKey& key, bool connected) { alice_events.on_connection(key, connected); });
    bob_transport.set_connection_handler(
        [&bob_events](const ChannelKey& key, bool connected) { bob_events.on_connection(key, connected); });

    const auto key = swarmshare::crypto::EncryptionService::generate_key();
    const swarmshare::ChunkData plaintext(4096, 0x42);
    alice_transport.set_message_handler([&](const ChannelKey& channel, swarmshare::protocol::PeerMessage message) {
        alice_events.on_message(channel, message);
        if (const auto* request = std::get_if<swarmshare::protocol::ChunkRequest>(&message)) {
            auto chunk = swarmshare::crypto::EncryptionService::encrypt_chunk(key, request->file_id, request->chunk_index, plaintext);
            if (!alice_transport.send(channel, swarmshare::protocol::ChunkResponse{std::move(chunk)}).ok()) {
                std::cerr << "[TransportLayer] response not sent" << std::endl;
            }
        }
    });
    bob_transport.set_message_handler([&bob_events](const ChannelKey& channel, swarmshare::protocol::PeerMessage message) {
        bob_events.on_message(channel, std::move(message));
    });

    alice_link->set_relay_handler([&alice_transport](const swarmshare::RelayEnvelope& envelope) {
        alice_transport.handle_signal(envelope);
    });
    bob_link->set_relay_handler([&bob_transport](const swarmshare::RelayEnvelope& envelope) {
        bob_transport.handle_signal(envelope);
    });

    auto shutdown = [&]() {
        bob_transport.stop();
        alice_transport.stop();
        bob_link->disconnect();
        alice_link->disconnect();
    };

    auto require = [&](bool condition, const char* message) {
        if (!condition) {
            std::cerr << "[TransportLayer] " << message << std::endl;
            shutdown();
            return false;
        }
        return true;
    };

    if (!require(alice_link->connect().ok() && bob_link->connect().ok(), "links failed to connect")) {
        return 1;
    }
    if (!require(alice_transport.start() && bob_transport.start(), "transport failed to start")) {
        return 1;
    }
    if (!require(registry.announce(alice, announce_for(shared_file, {"bob"})).ok(), "shared announce failed")) {
        return 1;
    }
    if (!require(registry.announce(alice, announce_for(private_file, {})).ok(), "private announce failed")) {
        return 1;
    }

    // A peer that connects and never sends its session id must not hold up other accepts.
    const auto silent = swarmshare::network::connect_tcp("127.0.0.1", alice_transport.listening_port(), 2s);
    if (!require(silent.has_value(), "silent peer could not connect")) {
        return 1;
    }

    const ChannelKey to_alice{alice, shared_file};
    const ChannelKey to_bob{bob, shared_file};
    if (!require(bob_transport.connect(to_alice).ok(), "connect refused")) {
        swarmshare::network::close_socket(*silent);
        return 1;
    }
    // Shorter than connect_timeout, the time a blocked accept would spend on the silent peer.
    const bool dialed = bob_events.wait_state(to_alice, true, 1500ms);
    swarmshare::network::close_socket(*silent);
    if (!require(dialed, "dialer never connected while another peer stalled")) {
        return 1;
    }
    if (!require(alice_events.wait_state(to_bob, true, 5s), "listener never connected")) {
        return 1;
    }
    if (!require(bob_transport.is_connected(to_alice) && alice_transport.connection_count() == 1, "channel missing")) {
        return 1;
    }

    if (!require(bob_transport.send(to_alice, swarmshare::protocol::ChunkRequest{shared_file, 1}).ok(), "send failed")) {
        return 1;
    }
    if (!require(bob_events.wait_messages(1, 5s), "no response through the channel")) {
        return 1;
    }
    const auto [channel, response] = bob_events.message(0);
    const auto* body = std::get_if<swarmshare::protocol::ChunkResponse>(&response);
    if (!require(channel == to_alice && body != nullptr, "unexpected response")) {
        return 1;
    }
    const auto decrypted = swarmshare::crypto::EncryptionService::decrypt_chunk(key, body->chunk);
    if (!require(decrypted.has_value() && *decrypted == plaintext && body->chunk.chunk_index == 1,
                 "chunk damaged in transit")) {
        return 1;
    }

    // The coordinator refuses to relay for a file bob cannot see; the attempt fails without a channel.
    const ChannelKey private_channel{alice, private_file};
    if (!require(bob_transport.connect(private_channel).ok(), "connect rejected synchronously")) {
        return 1;
    }
    if (!require(bob_events.wait_state(private_channel, false, 5s), "unauthorized negotiation not reported")) {
        return 1;
    }
    if (!require(!bob_transport.is_connected(private_channel), "unauthorized channel opened")) {
        return 1;
    }

    // Cutting a principal off closes its channels; the far side notices.
    alice_transport.close_principal(shared_file, "bob");
    if (!require(bob_events.wait_state(to_alice, false, 5s), "remote close not detected")) {
        return 1;
    }
    if (!require(!alice_transport.is_connected(to_bob) && alice_transport.connection_count() == 0, "channel survived")) {
        return 1;
    }

    shutdown();
    return 0;
}
