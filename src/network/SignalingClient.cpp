#include "swarmshare/network/SignalingClient.hpp"

#include "swarmshare/logging/StructuredLogger.hpp"
#include "swarmshare/network/Socket.hpp"

#include <array>
#include <utility>
#include <vector>

#include <sys/socket.h>

namespace swarmshare::network {

namespace {

using logging::StructuredLogger;
using logging::log_event;

constexpr std::size_t kReadChunk = 16 * 1024;

protocol::ResponsePayload connection_lost() {
    protocol::ResponsePayload payload{};
    payload.code = ErrorCode::TransportFailure;
    payload.message = "connection lost";
    return payload;
}

}  // namespace

SignalingClient::SignalingClient(DeviceKey self, SignalingClientConfig config)
    : CoordinatorLink(std::move(self)),
      config_(std::move(config)) {}

SignalingClient::~SignalingClient() {
    disconnect();
}

Status SignalingClient::connect() {
    {
        std::scoped_lock lock(connection_mutex_);
        if (connected_.load()) {
            return make_ok();
        }
        if (reader_.joinable()) {
            reader_.join();
        }
        if (socket_ != kInvalidSocket) {
            close_socket(socket_);
            socket_ = kInvalidSocket;
        }

        const auto socket = connect_tcp(config_.host, config_.port, config_.connect_timeout);
        if (!socket) {
            log_event(StructuredLogger::Level::Warning,
                      "link.connect_failed",
                      {{"host", config_.host}, {"port", std::to_string(config_.port)}});
            return make_error(ErrorCode::Unavailable, "coordinator unreachable");
        }
        socket_ = *socket;
        connected_.store(true);
        reader_ = std::thread(&SignalingClient::reader_loop, this, socket_);
    }

    protocol::SignalMessage hello{};
    hello.type = protocol::SignalType::Hello;
    hello.payload = protocol::HelloPayload{self(), config_.token};
    const auto response = send_and_wait(std::move(hello));
    const Status status = response.ok() ? Status{response.value->code, response.value->message} : response.status;
    if (!status.ok()) {
        disconnect();
        return status;
    }
    log_event(StructuredLogger::Level::Info,
              "link.connected",
              {{"device", device_key_to_string(self())}, {"host", config_.host}});
    return make_ok();
}

void SignalingClient::disconnect() {
    int socket = kInvalidSocket;
    std::thread reader;
    {
        std::scoped_lock lock(connection_mutex_);
        connected_.store(false);
        socket = socket_;
        socket_ = kInvalidSocket;
        reader = std::move(reader_);
    }
    shutdown_socket(socket);
    if (reader.joinable()) {
        if (reader.get_id() == std::this_thread::get_id()) {
            reader.detach();
        } else {
            reader.join();
        }
    }
    close_socket(socket);
    fail_pending();
}

Result<protocol::ResponsePayload> SignalingClient::exchange(protocol::SignalMessage request) {
    return send_and_wait(std::move(request));
}

Result<protocol::ResponsePayload> SignalingClient::send_and_wait(protocol::SignalMessage request) {
    if (!connected_.load()) {
        return make_failure<protocol::ResponsePayload>(ErrorCode::Unavailable, "not connected");
    }

    const auto id = next_request_id_.fetch_add(1);
    request.request_id = id;
    auto pending = std::make_shared<Pending>();
    auto future = pending->get_future();
    {
        std::scoped_lock lock(pending_mutex_);
        pending_[id] = pending;
    }

    const auto frame = protocol::encode_frame(request);
    bool sent = false;
    {
        std::scoped_lock lock(send_mutex_);
        int socket = kInvalidSocket;
        {
            std::scoped_lock connection_lock(connection_mutex_);
            socket = socket_;
        }
        sent = socket != kInvalidSocket && send_all(socket, frame.data(), frame.size());
    }
    if (!sent) {
        std::scoped_lock lock(pending_mutex_);
        pending_.erase(id);
        return make_failure<protocol::ResponsePayload>(ErrorCode::TransportFailure, "send failed");
    }

    if (future.wait_for(config_.request_timeout) != std::future_status::ready) {
        std::scoped_lock lock(pending_mutex_);
        pending_.erase(id);
        return make_failure<protocol::ResponsePayload>(ErrorCode::Unavailable, "coordinator timeout");
    }
    return make_result(future.get());
}

void SignalingClient::reader_loop(int socket) {
    protocol::FrameAssembler assembler;
    std::array<std::uint8_t, kReadChunk> buffer{};
    bool healthy = true;
    while (healthy) {
        const auto received = ::recv(socket, buffer.data(), buffer.size(), 0);
        if (received <= 0) {
            break;
        }
        assembler.append(std::span<const std::uint8_t>(buffer.data(), static_cast<std::size_t>(received)));
        while (auto frame = assembler.next()) {
            auto message = protocol::decode(*frame);
            if (!message) {
                log_event(StructuredLogger::Level::Warning, "link.malformed_frame", {{"size", std::to_string(frame->size())}});
                healthy = false;
                break;
            }
            if (message->type != protocol::SignalType::Response) {
                deliver(*message);
                continue;
            }
            std::shared_ptr<Pending> pending;
            {
                std::scoped_lock lock(pending_mutex_);
                const auto it = pending_.find(message->request_id);
                if (it != pending_.end()) {
                    pending = std::move(it->second);
                    pending_.erase(it);
                }
            }
            if (auto* body = std::get_if<protocol::ResponsePayload>(&message->payload); pending && body) {
                pending->set_value(std::move(*body));
            }
        }
        if (assembler.overflowed()) {
            healthy = false;
        }
    }

    const bool was_connected = connected_.exchange(false);
    fail_pending();
    if (was_connected) {
        log_event(StructuredLogger::Level::Warning, "link.disconnected", {{"device", device_key_to_string(self())}});
        notify_disconnected();
    }
}

void SignalingClient::fail_pending() {
    std::unordered_map<std::uint32_t, std::shared_ptr<Pending>> pending;
    {
        std::scoped_lock lock(pending_mutex_);
        pending.swap(pending_);
    }
    for (auto& [_, promise] : pending) {
        promise->set_value(connection_lost());
    }
}

}  // namespace swarmshare::network
