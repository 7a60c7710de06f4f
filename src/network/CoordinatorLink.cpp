#include "swarmshare/network/CoordinatorLink.hpp"

#include "swarmshare/logging/StructuredLogger.hpp"

#include <utility>

namespace swarmshare::network {

namespace {

using protocol::ResponseBody;
using protocol::ResponsePayload;
using protocol::SignalType;

Status to_status(const Result<ResponsePayload>& result) {
    if (!result.ok()) {
        return result.status;
    }
    return Status{result.value->code, result.value->message};
}

template <typename T>
Result<T> expect_body(Result<ResponsePayload> result, ResponseBody body, T ResponsePayload::*member) {
    if (!result.status.ok()) {
        return make_failure<T>(std::move(result.status));
    }
    auto& payload = *result.value;
    if (payload.code != ErrorCode::None) {
        return make_failure<T>(payload.code, std::move(payload.message));
    }
    if (payload.body != body) {
        return make_failure<T>(ErrorCode::TransportFailure, "unexpected response body");
    }
    return make_result(std::move(payload.*member));
}

}  // namespace

CoordinatorLink::CoordinatorLink(DeviceKey self)
    : self_(std::move(self)) {}

Result<FileInfo> CoordinatorLink::announce(const AnnounceRequest& request) {
    return expect_body(call(SignalType::Announce, protocol::AnnouncePayload{request}),
                       ResponseBody::File,
                       &ResponsePayload::info);
}

Status CoordinatorLink::update_chunks(const FileId& file_id,
                                      const std::vector<ChunkIndex>& chunks,
                                      std::uint16_t active_uploads) {
    return to_status(call(SignalType::UpdateChunks, protocol::ChunkListPayload{file_id, chunks, active_uploads}));
}

Result<FileInfo> CoordinatorLink::get_info(const FileId& file_id) {
    return expect_body(call(SignalType::GetInfo, protocol::FileQueryPayload{file_id}),
                       ResponseBody::File,
                       &ResponsePayload::info);
}

Result<std::vector<SeederInfo>> CoordinatorLink::list_seeders(const FileId& file_id) {
    return expect_body(call(SignalType::ListSeeders, protocol::FileQueryPayload{file_id}),
                       ResponseBody::Seeders,
                       &ResponsePayload::seeders);
}

Result<std::vector<PrincipalId>> CoordinatorLink::share_update(const FileId& file_id,
                                                               ShareAction action,
                                                               const std::vector<PrincipalId>& targets) {
    return expect_body(call(SignalType::ShareUpdate, protocol::ShareUpdatePayload{file_id, action, targets}),
                       ResponseBody::Principals,
                       &ResponsePayload::principals);
}

Status CoordinatorLink::unannounce(const FileId& file_id) {
    return to_status(call(SignalType::Unannounce, protocol::FileQueryPayload{file_id}));
}

Status CoordinatorLink::register_leecher(const FileId& file_id, const std::vector<ChunkIndex>& chunks) {
    return to_status(call(SignalType::RegisterLeecher, protocol::ChunkListPayload{file_id, chunks, 0}));
}

Status CoordinatorLink::unregister_leecher(const FileId& file_id) {
    return to_status(call(SignalType::UnregisterLeecher, protocol::FileQueryPayload{file_id}));
}

Status CoordinatorLink::relay(const RelayEnvelope& envelope) {
    protocol::RelayPayload payload{envelope.file_id, self_, envelope.to, envelope.payload};
    return to_status(call(protocol::relay_signal_type(envelope.kind), std::move(payload)));
}

void CoordinatorLink::set_push_handler(PushHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    push_handler_ = std::move(handler);
}

void CoordinatorLink::set_relay_handler(RelayHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    relay_handler_ = std::move(handler);
}

void CoordinatorLink::set_disconnect_handler(DisconnectHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    disconnect_handler_ = std::move(handler);
}

Result<ResponsePayload> CoordinatorLink::call(SignalType type, protocol::SignalPayload payload) {
    protocol::SignalMessage request{};
    request.type = type;
    request.payload = std::move(payload);
    return exchange(std::move(request));
}

void CoordinatorLink::deliver(const protocol::SignalMessage& message) {
    if (const auto kind = protocol::push_kind_for(message.type)) {
        const auto* body = std::get_if<protocol::NotifyPayload>(&message.payload);
        if (body == nullptr) {
            return;
        }
        PushHandler handler;
        {
            std::scoped_lock lock(handler_mutex_);
            handler = push_handler_;
        }
        if (handler) {
            handler(protocol::to_push(*kind, *body));
        }
        return;
    }

    if (const auto kind = protocol::relay_kind_for(message.type)) {
        const auto* body = std::get_if<protocol::RelayPayload>(&message.payload);
        if (body == nullptr) {
            return;
        }
        RelayHandler handler;
        {
            std::scoped_lock lock(handler_mutex_);
            handler = relay_handler_;
        }
        if (handler) {
            handler(RelayEnvelope{*kind, body->file_id, body->from, body->to, body->payload});
        }
        return;
    }

    logging::log_event(logging::StructuredLogger::Level::Debug,
                       "link.unexpected_message",
                       {{"type", std::to_string(static_cast<int>(message.type))}});
}

void CoordinatorLink::notify_disconnected() {
    DisconnectHandler handler;
    {
        std::scoped_lock lock(handler_mutex_);
        handler = disconnect_handler_;
    }
    if (handler) {
        handler();
    }
}

}  // namespace swarmshare::network
