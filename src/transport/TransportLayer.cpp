#include "swarmshare/transport/TransportLayer.hpp"

#include "swarmshare/crypto/ChaCha20.hpp"
#include "swarmshare/crypto/EncryptionService.hpp"
#include "swarmshare/crypto/HmacSha256.hpp"
#include "swarmshare/logging/StructuredLogger.hpp"
#include "swarmshare/network/Socket.hpp"
#include "swarmshare/protocol/Wire.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cerrno>
#include <utility>

#include <sys/socket.h>

namespace swarmshare::transport {

namespace {

using logging::StructuredLogger;
using logging::log_event;

constexpr std::size_t kSessionIdSize = 16;
constexpr std::size_t kLengthFieldSize = sizeof(std::uint32_t);
constexpr std::chrono::milliseconds kSignalTick{100};

using Fields = std::map<std::string, std::string>;

// Negotiation payloads are `key=value` pairs separated by ';'. The coordinator never reads them.
std::string encode_fields(const Fields& fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty()) {
            out.push_back(';');
        }
        out += key;
        out.push_back('=');
        out += value;
    }
    return out;
}

Fields parse_fields(const std::string& text) {
    Fields fields;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find(';', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        const auto item = text.substr(start, end - start);
        const auto eq = item.find('=');
        if (eq != std::string::npos && eq > 0) {
            fields[item.substr(0, eq)] = item.substr(eq + 1);
        }
        start = end + 1;
    }
    return fields;
}

std::optional<std::uint64_t> parse_u64(const std::string& text) {
    std::uint64_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

template <std::size_t N>
std::optional<std::array<std::uint8_t, N>> parse_fixed_hex(const std::string& text) {
    const auto bytes = from_hex(text);
    if (!bytes || bytes->size() != N) {
        return std::nullopt;
    }
    std::array<std::uint8_t, N> out{};
    std::copy(bytes->begin(), bytes->end(), out.begin());
    return out;
}

std::string describe(const ChannelKey& key) {
    return device_key_to_string(key.peer);
}

}  // namespace

TransportLayer::TransportLayer(network::CoordinatorLink& link, TransportConfig config)
    : link_(link),
      config_(std::move(config)) {
    if (config_.advertised_host.empty()) {
        config_.advertised_host = config_.listen_host;
    }
}

TransportLayer::~TransportLayer() {
    stop();
}

bool TransportLayer::start() {
    if (running_.load()) {
        return true;
    }
    const auto listener = network::listen_tcp(config_.listen_host, config_.listen_port);
    if (!listener) {
        log_event(StructuredLogger::Level::Error,
                  "transport.listen_failed",
                  {{"host", config_.listen_host}, {"port", std::to_string(config_.listen_port)}});
        return false;
    }
    listen_socket_ = listener->first;
    bound_port_ = listener->second;
    running_.store(true);
    accept_thread_ = std::thread(&TransportLayer::accept_loop, this);
    signal_thread_ = std::thread(&TransportLayer::signal_loop, this);
    return true;
}

void TransportLayer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    network::shutdown_socket(listen_socket_);
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    network::close_socket(listen_socket_);
    listen_socket_ = network::kInvalidSocket;
    reap_handshakes(true);

    task_cv_.notify_all();
    if (signal_thread_.joinable()) {
        signal_thread_.join();
    }
    {
        std::scoped_lock lock(task_mutex_);
        tasks_.clear();
    }

    for (const auto& channel : extract_channels([](const ChannelKey&) { return true; })) {
        teardown(channel);
    }
    std::scoped_lock lock(state_mutex_);
    offers_.clear();
    accepts_.clear();
}

void TransportLayer::set_message_handler(MessageHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    message_handler_ = std::move(handler);
}

void TransportLayer::set_connection_handler(ConnectionHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    connection_handler_ = std::move(handler);
}

void TransportLayer::set_admission_hook(AdmissionHook hook) {
    std::scoped_lock lock(handler_mutex_);
    admission_hook_ = std::move(hook);
}

void TransportLayer::handle_signal(const RelayEnvelope& envelope) {
    post([this, envelope]() {
        switch (envelope.kind) {
            case RelayKind::Offer:
                on_offer(envelope);
                break;
            case RelayKind::Answer:
                on_answer(envelope);
                break;
            case RelayKind::IceCandidate:
                on_candidate(envelope);
                break;
        }
    });
}

Status TransportLayer::connect(const ChannelKey& key) {
    if (!running_.load()) {
        return make_error(ErrorCode::Unavailable, "transport stopped");
    }
    if (key.peer.principal.empty() || key.peer.device.empty()) {
        return make_error(ErrorCode::InvalidArgument, "peer device required");
    }

    std::array<std::uint8_t, kSessionIdSize> session_bytes{};
    crypto::EncryptionService::random_bytes(session_bytes);
    const auto session_id = to_hex(session_bytes);

    PendingOffer offer{};
    offer.key = key;
    offer.keypair = network::KeyExchange::generate_keypair();
    crypto::EncryptionService::random_bytes(offer.nonce);
    offer.deadline = std::chrono::steady_clock::now() + config_.connect_timeout;

    Fields fields{{"session", session_id},
                  {"public", std::to_string(offer.keypair.public_key)},
                  {"nonce", to_hex(offer.nonce)}};
    {
        std::scoped_lock lock(state_mutex_);
        if (const auto it = channels_.find(key); it != channels_.end() && !it->second->closing.load()) {
            return make_ok();
        }
        for (const auto& [_, pending] : offers_) {
            if (pending.key == key) {
                return make_ok();
            }
        }
        offers_.emplace(session_id, std::move(offer));
    }

    post([this, key, session_id, payload = encode_fields(fields)]() {
        const auto status = link_.relay(RelayEnvelope{RelayKind::Offer, key.file_id, link_.self(), key.peer, payload});
        if (status.ok()) {
            return;
        }
        bool dropped = false;
        {
            std::scoped_lock lock(state_mutex_);
            dropped = offers_.erase(session_id) > 0;
        }
        log_event(StructuredLogger::Level::Warning,
                  "transport.offer_failed",
                  {{"peer", describe(key)}, {"file_id", key.file_id}, {"code", std::string(error_code_name(status.code))}});
        if (dropped) {
            notify_connection(key, false);
        }
    });
    return make_ok();
}

Status TransportLayer::send(const ChannelKey& key, const protocol::PeerMessage& message) {
    std::shared_ptr<Channel> channel;
    {
        std::scoped_lock lock(state_mutex_);
        const auto it = channels_.find(key);
        if (it == channels_.end()) {
            return make_error(ErrorCode::TransportFailure, "no channel");
        }
        channel = it->second;
    }
    if (channel->closing.load()) {
        return make_error(ErrorCode::TransportFailure, "channel closing");
    }
    const auto encoded = protocol::encode_peer_message(message);
    if (encoded.size() > kMaxFramePayload) {
        return make_error(ErrorCode::InvalidArgument, "message too large");
    }
    if (!write_frame(*channel, encoded)) {
        // The reader notices the broken socket and reports the loss.
        network::shutdown_socket(channel->socket);
        return make_error(ErrorCode::TransportFailure, "send failed");
    }
    return make_ok();
}

void TransportLayer::close(const ChannelKey& key) {
    for (const auto& channel : extract_channels([&](const ChannelKey& candidate) { return candidate == key; })) {
        teardown(channel);
    }
    std::scoped_lock lock(state_mutex_);
    std::erase_if(offers_, [&](const auto& entry) { return entry.second.key == key; });
    std::erase_if(accepts_, [&](const auto& entry) { return entry.second.key == key; });
}

void TransportLayer::close_file(const FileId& file_id) {
    const auto channels = extract_channels([&](const ChannelKey& key) { return key.file_id == file_id; });
    {
        std::scoped_lock lock(state_mutex_);
        std::erase_if(offers_, [&](const auto& entry) { return entry.second.key.file_id == file_id; });
        std::erase_if(accepts_, [&](const auto& entry) { return entry.second.key.file_id == file_id; });
    }
    for (const auto& channel : channels) {
        teardown(channel);
    }
}

void TransportLayer::close_principal(const FileId& file_id, const PrincipalId& principal) {
    const auto matches = [&](const ChannelKey& key) {
        return key.file_id == file_id && key.peer.principal == principal;
    };
    const auto channels = extract_channels(matches);
    {
        std::scoped_lock lock(state_mutex_);
        std::erase_if(offers_, [&](const auto& entry) { return matches(entry.second.key); });
        std::erase_if(accepts_, [&](const auto& entry) { return matches(entry.second.key); });
    }
    for (const auto& channel : channels) {
        teardown(channel);
    }
}

bool TransportLayer::is_connected(const ChannelKey& key) const {
    std::scoped_lock lock(state_mutex_);
    const auto it = channels_.find(key);
    return it != channels_.end() && !it->second->closing.load();
}

std::size_t TransportLayer::connection_count() const {
    std::scoped_lock lock(state_mutex_);
    return channels_.size();
}

std::size_t TransportLayer::pending_count() const {
    std::scoped_lock lock(state_mutex_);
    return offers_.size() + accepts_.size();
}

void TransportLayer::post(Task task) {
    {
        std::scoped_lock lock(task_mutex_);
        tasks_.push_back(std::move(task));
    }
    task_cv_.notify_one();
}

void TransportLayer::signal_loop() {
    while (running_.load()) {
        std::deque<Task> tasks;
        {
            std::unique_lock lock(task_mutex_);
            task_cv_.wait_for(lock, kSignalTick, [this]() { return !tasks_.empty() || !running_.load(); });
            tasks.swap(tasks_);
        }
        for (auto& task : tasks) {
            if (!running_.load()) {
                break;
            }
            task();
        }
        expire_pending();
    }
}

void TransportLayer::accept_loop() {
    while (running_.load()) {
        const int socket = ::accept4(listen_socket_, nullptr, nullptr, SOCK_CLOEXEC);
        if (socket < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (!running_.load()) {
                break;
            }
            continue;
        }

        reap_handshakes(false);
        auto handshake = std::make_shared<Handshake>();
        handshake->socket = socket;
        std::scoped_lock lock(handshake_mutex_);
        handshake->worker = std::thread(&TransportLayer::complete_accept, this, handshake);
        handshakes_.push_back(std::move(handshake));
    }
}

// Runs on its own thread so a peer that never sends its session id only stalls itself.
void TransportLayer::complete_accept(std::shared_ptr<Handshake> handshake) {
    const int socket = handshake->socket;
    std::array<std::uint8_t, kSessionIdSize> session_bytes{};
    network::set_recv_timeout(socket, config_.connect_timeout);
    const bool received = network::recv_all(socket, session_bytes.data(), session_bytes.size());
    network::set_recv_timeout(socket, std::chrono::milliseconds::zero());
    {
        std::scoped_lock lock(handshake_mutex_);
        handshake->socket = network::kInvalidSocket;
    }

    std::optional<PendingAccept> accept;
    if (received && running_.load()) {
        std::scoped_lock lock(state_mutex_);
        const auto it = accepts_.find(to_hex(session_bytes));
        if (it != accepts_.end()) {
            accept = std::move(it->second);
            accepts_.erase(it);
        }
    }
    if (!accept) {
        if (received) {
            log_event(StructuredLogger::Level::Warning, "transport.unknown_session", {});
        }
        network::close_socket(socket);
    } else {
        establish(accept->key, socket, accept->keys, "accept");
    }
    handshake->finished.store(true);
}

void TransportLayer::reap_handshakes(bool all) {
    std::vector<std::shared_ptr<Handshake>> reaped;
    {
        std::scoped_lock lock(handshake_mutex_);
        for (auto it = handshakes_.begin(); it != handshakes_.end();) {
            if (all || (*it)->finished.load()) {
                if ((*it)->socket != network::kInvalidSocket) {
                    network::shutdown_socket((*it)->socket);
                }
                reaped.push_back(std::move(*it));
                it = handshakes_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& handshake : reaped) {
        if (handshake->worker.joinable()) {
            handshake->worker.join();
        }
    }
}

void TransportLayer::on_offer(const RelayEnvelope& envelope) {
    const auto fields = parse_fields(envelope.payload);
    const auto session = fields.find("session");
    const auto remote_public = fields.contains("public") ? parse_u64(fields.at("public")) : std::nullopt;
    const auto offer_nonce =
        fields.contains("nonce") ? parse_fixed_hex<network::kHandshakeNonceSize>(fields.at("nonce")) : std::nullopt;
    if (session == fields.end() || !remote_public || !offer_nonce ||
        !network::KeyExchange::validate_public(*remote_public)) {
        log_event(StructuredLogger::Level::Warning, "transport.malformed_offer", {{"peer", device_key_to_string(envelope.from)}});
        return;
    }

    AdmissionHook hook;
    {
        std::scoped_lock lock(handler_mutex_);
        hook = admission_hook_;
    }
    if (hook && !hook(envelope.from, envelope.file_id)) {
        log_event(StructuredLogger::Level::Warning,
                  "transport.offer_denied",
                  {{"peer", device_key_to_string(envelope.from)}, {"file_id", envelope.file_id}});
        return;
    }

    const auto keypair = network::KeyExchange::generate_keypair();
    network::HandshakeNonce answer_nonce{};
    crypto::EncryptionService::random_bytes(answer_nonce);

    PendingAccept accept{};
    accept.key = ChannelKey{envelope.from, envelope.file_id};
    accept.keys = network::KeyExchange::derive_channel_keys(keypair.private_key, *remote_public, *offer_nonce, answer_nonce);
    accept.deadline = std::chrono::steady_clock::now() + config_.connect_timeout;
    {
        std::scoped_lock lock(state_mutex_);
        accepts_[session->second] = accept;
    }

    const Fields answer{{"session", session->second},
                        {"public", std::to_string(keypair.public_key)},
                        {"nonce", to_hex(answer_nonce)}};
    const Fields candidate{{"session", session->second},
                           {"endpoint", config_.advertised_host + ":" + std::to_string(bound_port_)}};
    auto status =
        link_.relay(RelayEnvelope{RelayKind::Answer, envelope.file_id, link_.self(), envelope.from, encode_fields(answer)});
    if (status.ok()) {
        status = link_.relay(
            RelayEnvelope{RelayKind::IceCandidate, envelope.file_id, link_.self(), envelope.from, encode_fields(candidate)});
    }
    if (!status.ok()) {
        std::scoped_lock lock(state_mutex_);
        accepts_.erase(session->second);
    }
}

void TransportLayer::on_answer(const RelayEnvelope& envelope) {
    const auto fields = parse_fields(envelope.payload);
    const auto session = fields.find("session");
    const auto remote_public = fields.contains("public") ? parse_u64(fields.at("public")) : std::nullopt;
    const auto answer_nonce =
        fields.contains("nonce") ? parse_fixed_hex<network::kHandshakeNonceSize>(fields.at("nonce")) : std::nullopt;
    if (session == fields.end() || !remote_public || !answer_nonce ||
        !network::KeyExchange::validate_public(*remote_public)) {
        return;
    }
    {
        std::scoped_lock lock(state_mutex_);
        const auto it = offers_.find(session->second);
        if (it == offers_.end() || it->second.key.peer != envelope.from) {
            return;
        }
        it->second.keys = network::KeyExchange::derive_channel_keys(
            it->second.keypair.private_key, *remote_public, it->second.nonce, *answer_nonce);
    }
    try_dial(session->second);
}

void TransportLayer::on_candidate(const RelayEnvelope& envelope) {
    const auto fields = parse_fields(envelope.payload);
    const auto session = fields.find("session");
    const auto endpoint = fields.find("endpoint");
    if (session == fields.end() || endpoint == fields.end()) {
        return;
    }
    {
        std::scoped_lock lock(state_mutex_);
        const auto it = offers_.find(session->second);
        if (it == offers_.end() || it->second.key.peer != envelope.from) {
            return;
        }
        it->second.endpoint = endpoint->second;
    }
    try_dial(session->second);
}

void TransportLayer::try_dial(const std::string& session_id) {
    PendingOffer offer{};
    {
        std::scoped_lock lock(state_mutex_);
        const auto it = offers_.find(session_id);
        if (it == offers_.end() || !it->second.keys || it->second.endpoint.empty()) {
            return;
        }
        offer = std::move(it->second);
        offers_.erase(it);
    }

    const auto endpoint = network::parse_endpoint(offer.endpoint);
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        offer.deadline - std::chrono::steady_clock::now());
    std::optional<int> socket;
    if (endpoint && remaining.count() > 0) {
        socket = network::connect_tcp(endpoint->first, endpoint->second, remaining);
    }
    const auto session_bytes = from_hex(session_id);
    if (socket && session_bytes && !network::send_all(*socket, session_bytes->data(), session_bytes->size())) {
        network::close_socket(*socket);
        socket.reset();
    }
    if (!socket) {
        log_event(StructuredLogger::Level::Warning,
                  "transport.connect_failed",
                  {{"peer", describe(offer.key)}, {"file_id", offer.key.file_id}, {"endpoint", offer.endpoint}});
        notify_connection(offer.key, false);
        return;
    }
    establish(offer.key, *socket, *offer.keys, "dial");
}

void TransportLayer::expire_pending() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<ChannelKey> expired;
    {
        std::scoped_lock lock(state_mutex_);
        for (auto it = offers_.begin(); it != offers_.end();) {
            if (it->second.deadline <= now) {
                expired.push_back(it->second.key);
                it = offers_.erase(it);
            } else {
                ++it;
            }
        }
        std::erase_if(accepts_, [&](const auto& entry) { return entry.second.deadline <= now; });
    }
    for (const auto& key : expired) {
        log_event(StructuredLogger::Level::Warning,
                  "transport.connect_timeout",
                  {{"peer", describe(key)}, {"file_id", key.file_id}});
        notify_connection(key, false);
    }
}

void TransportLayer::establish(const ChannelKey& key, int socket, const network::ChannelKeys& keys, const char* origin) {
    auto channel = std::make_shared<Channel>();
    channel->key = key;
    channel->socket = socket;
    channel->keys = keys;
    {
        std::scoped_lock lock(state_mutex_);
        if (const auto it = channels_.find(key); it != channels_.end() && !it->second->closing.load()) {
            network::close_socket(socket);
            return;
        }
        channels_[key] = channel;
        // Started under the lock so a concurrent close() always sees a joinable reader.
        channel->reader = std::thread(&TransportLayer::reader_loop, this, channel);
    }
    log_event(StructuredLogger::Level::Info,
              "transport.connected",
              {{"peer", describe(key)}, {"file_id", key.file_id}, {"origin", origin}});
    notify_connection(key, true);
}

void TransportLayer::teardown(const std::shared_ptr<Channel>& channel) {
    if (channel->closing.exchange(true)) {
        return;
    }
    network::shutdown_socket(channel->socket);
    if (channel->reader.joinable()) {
        if (channel->reader.get_id() == std::this_thread::get_id()) {
            channel->reader.detach();
        } else {
            channel->reader.join();
        }
    }
    network::close_socket(channel->socket);
    log_event(StructuredLogger::Level::Info,
              "transport.closed",
              {{"peer", describe(channel->key)}, {"file_id", channel->key.file_id}, {"reason", "local"}});
}

std::vector<std::shared_ptr<TransportLayer::Channel>> TransportLayer::extract_channels(
    const std::function<bool(const ChannelKey&)>& match) {
    std::vector<std::shared_ptr<Channel>> extracted;
    std::scoped_lock lock(state_mutex_);
    for (auto it = channels_.begin(); it != channels_.end();) {
        if (match(it->first)) {
            extracted.push_back(std::move(it->second));
            it = channels_.erase(it);
        } else {
            ++it;
        }
    }
    return extracted;
}

void TransportLayer::reader_loop(std::shared_ptr<Channel> channel) {
    std::vector<std::uint8_t> plaintext;
    while (!channel->closing.load() && read_frame(*channel, plaintext)) {
        auto message = protocol::decode_peer_message(plaintext);
        if (!message) {
            log_event(StructuredLogger::Level::Warning,
                      "transport.malformed_message",
                      {{"peer", describe(channel->key)}, {"size", std::to_string(plaintext.size())}});
            break;
        }
        MessageHandler handler;
        {
            std::scoped_lock lock(handler_mutex_);
            handler = message_handler_;
        }
        if (handler) {
            handler(channel->key, std::move(*message));
        }
    }

    if (channel->closing.exchange(true)) {
        // close() owns the teardown and joins this thread.
        return;
    }
    {
        std::scoped_lock lock(state_mutex_);
        if (const auto it = channels_.find(channel->key); it != channels_.end() && it->second == channel) {
            channels_.erase(it);
        }
        channel->reader.detach();
    }
    network::close_socket(channel->socket);
    log_event(StructuredLogger::Level::Info,
              "transport.closed",
              {{"peer", describe(channel->key)}, {"file_id", channel->key.file_id}, {"reason", "remote"}});
    notify_connection(channel->key, false);
}

bool TransportLayer::write_frame(Channel& channel, std::span<const std::uint8_t> plaintext) {
    crypto::Nonce nonce{};
    crypto::EncryptionService::random_bytes(nonce.bytes);
    const auto ciphertext = crypto::ChaCha20::apply(channel.keys.cipher, nonce, plaintext);

    std::vector<std::uint8_t> frame(kFrameNonceSize + kLengthFieldSize);
    std::copy(nonce.bytes.begin(), nonce.bytes.end(), frame.begin());
    protocol::write_be32(frame.data() + kFrameNonceSize, static_cast<std::uint32_t>(ciphertext.size()));
    frame.insert(frame.end(), ciphertext.begin(), ciphertext.end());
    const auto tag = crypto::HmacSha256::compute(channel.keys.mac, frame);
    frame.insert(frame.end(), tag.begin(), tag.begin() + kFrameTagSize);

    std::scoped_lock lock(channel.send_mutex);
    return network::send_all(channel.socket, frame.data(), frame.size());
}

bool TransportLayer::read_frame(Channel& channel, std::vector<std::uint8_t>& plaintext) {
    std::vector<std::uint8_t> header(kFrameNonceSize + kLengthFieldSize);
    if (!network::recv_all(channel.socket, header.data(), header.size())) {
        return false;
    }
    const auto length = protocol::read_be32(header.data() + kFrameNonceSize);
    if (length > kMaxFramePayload) {
        log_event(StructuredLogger::Level::Warning,
                  "transport.oversized_frame",
                  {{"peer", describe(channel.key)}, {"size", std::to_string(length)}});
        return false;
    }

    std::vector<std::uint8_t> authenticated = std::move(header);
    authenticated.resize(kFrameNonceSize + kLengthFieldSize + length);
    std::array<std::uint8_t, kFrameTagSize> tag{};
    if ((length > 0 && !network::recv_all(channel.socket, authenticated.data() + kFrameNonceSize + kLengthFieldSize, length)) ||
        !network::recv_all(channel.socket, tag.data(), tag.size())) {
        return false;
    }
    if (!crypto::HmacSha256::verify(channel.keys.mac, authenticated, tag)) {
        log_event(StructuredLogger::Level::Warning, "transport.bad_tag", {{"peer", describe(channel.key)}});
        return false;
    }

    crypto::Nonce nonce{};
    std::copy(authenticated.begin(), authenticated.begin() + kFrameNonceSize, nonce.bytes.begin());
    plaintext = crypto::ChaCha20::apply(
        channel.keys.cipher,
        nonce,
        std::span<const std::uint8_t>(authenticated.data() + kFrameNonceSize + kLengthFieldSize, length));
    return true;
}

void TransportLayer::notify_connection(const ChannelKey& key, bool connected) {
    ConnectionHandler handler;
    {
        std::scoped_lock lock(handler_mutex_);
        handler = connection_handler_;
    }
    if (handler) {
        handler(key, connected);
    }
}

}  // namespace swarmshare::transport
