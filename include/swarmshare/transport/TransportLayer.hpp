#pragma once

#include "swarmshare/Error.hpp"
#include "swarmshare/SwarmTypes.hpp"
#include "swarmshare/Types.hpp"
#include "swarmshare/network/CoordinatorLink.hpp"
#include "swarmshare/network/KeyExchange.hpp"
#include "swarmshare/protocol/PeerMessage.hpp"

#include <atomic>
#include <chrono>
#include <compare>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace swarmshare::transport {

inline constexpr std::size_t kFrameNonceSize = 12;
inline constexpr std::size_t kFrameTagSize = 16;
inline constexpr std::size_t kMaxFramePayload = 1024 * 1024;

struct TransportConfig {
    std::string listen_host{"127.0.0.1"};
    std::uint16_t listen_port{0};
    // Address placed in ICE candidates; defaults to listen_host.
    std::string advertised_host;
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(5)};
};

// One channel per (remote device, file).
struct ChannelKey {
    DeviceKey peer;
    FileId file_id;

    auto operator<=>(const ChannelKey&) const = default;
};

// Encrypted point-to-point channels negotiated through coordinator-relayed offer/answer/ICE
// messages. Frames are [nonce][u32 length][ChaCha20 body][truncated HMAC-SHA256 tag].
//
// Handlers run on transport threads and must not block; they may call send() and close().
class TransportLayer {
public:
    using MessageHandler = std::function<void(const ChannelKey& channel, protocol::PeerMessage message)>;
    // connected=false reports a failed negotiation or a channel lost without close() being called.
    using ConnectionHandler = std::function<void(const ChannelKey& channel, bool connected)>;
    // Consulted for every inbound offer before anything is answered.
    using AdmissionHook = std::function<bool(const DeviceKey& peer, const FileId& file_id)>;

    TransportLayer(network::CoordinatorLink& link, TransportConfig config);
    ~TransportLayer();

    TransportLayer(const TransportLayer&) = delete;
    TransportLayer& operator=(const TransportLayer&) = delete;

    bool start();
    void stop();
    [[nodiscard]] std::uint16_t listening_port() const noexcept { return bound_port_; }

    void set_message_handler(MessageHandler handler);
    void set_connection_handler(ConnectionHandler handler);
    void set_admission_hook(AdmissionHook hook);

    // Entry point for relayed negotiation messages; returns without blocking.
    void handle_signal(const RelayEnvelope& envelope);

    // Starts a negotiation; the outcome arrives through the connection handler.
    Status connect(const ChannelKey& channel);
    Status send(const ChannelKey& channel, const protocol::PeerMessage& message);
    void close(const ChannelKey& channel);
    // Closes every channel and abandons every negotiation for the file.
    void close_file(const FileId& file_id);
    // Closes the file's channels to every device of the principal.
    void close_principal(const FileId& file_id, const PrincipalId& principal);

    [[nodiscard]] bool is_connected(const ChannelKey& channel) const;
    [[nodiscard]] std::size_t connection_count() const;
    [[nodiscard]] std::size_t pending_count() const;

private:
    struct Channel {
        ChannelKey key;
        int socket{-1};
        network::ChannelKeys keys{};
        std::mutex send_mutex;
        std::thread reader;
        std::atomic<bool> closing{false};
    };

    struct PendingOffer {
        ChannelKey key;
        network::KeyPair keypair{};
        network::HandshakeNonce nonce{};
        std::optional<network::ChannelKeys> keys;
        std::string endpoint;
        std::chrono::steady_clock::time_point deadline{};
    };

    struct PendingAccept {
        ChannelKey key;
        network::ChannelKeys keys{};
        std::chrono::steady_clock::time_point deadline{};
    };

    // An accepted socket whose session id has not arrived yet.
    struct Handshake {
        int socket{-1};
        std::thread worker;
        std::atomic<bool> finished{false};
    };

    using Task = std::function<void()>;

    void post(Task task);
    void signal_loop();
    void accept_loop();
    void complete_accept(std::shared_ptr<Handshake> handshake);
    void reap_handshakes(bool all);
    void reader_loop(std::shared_ptr<Channel> channel);

    void on_offer(const RelayEnvelope& envelope);
    void on_answer(const RelayEnvelope& envelope);
    void on_candidate(const RelayEnvelope& envelope);
    void try_dial(const std::string& session_id);
    void expire_pending();

    void establish(const ChannelKey& key, int socket, const network::ChannelKeys& keys, const char* origin);
    void teardown(const std::shared_ptr<Channel>& channel);
    std::vector<std::shared_ptr<Channel>> extract_channels(const std::function<bool(const ChannelKey&)>& match);

    bool write_frame(Channel& channel, std::span<const std::uint8_t> plaintext);
    bool read_frame(Channel& channel, std::vector<std::uint8_t>& plaintext);

    void notify_connection(const ChannelKey& key, bool connected);

    network::CoordinatorLink& link_;
    TransportConfig config_;

    std::atomic<bool> running_{false};
    int listen_socket_{-1};
    std::uint16_t bound_port_{0};
    std::thread accept_thread_;
    std::mutex handshake_mutex_;
    std::vector<std::shared_ptr<Handshake>> handshakes_;

    std::thread signal_thread_;
    std::mutex task_mutex_;
    std::condition_variable task_cv_;
    std::deque<Task> tasks_;

    mutable std::mutex handler_mutex_;
    MessageHandler message_handler_;
    ConnectionHandler connection_handler_;
    AdmissionHook admission_hook_;

    mutable std::mutex state_mutex_;
    std::map<ChannelKey, std::shared_ptr<Channel>> channels_;
    std::map<std::string, PendingOffer> offers_;
    std::map<std::string, PendingAccept> accepts_;
};

}  // namespace swarmshare::transport
