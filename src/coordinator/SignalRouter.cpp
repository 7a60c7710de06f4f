#include "swarmshare/coordinator/SignalRouter.hpp"

#include "swarmshare/logging/StructuredLogger.hpp"

#include <algorithm>
#include <type_traits>

namespace swarmshare::coordinator {

namespace {

using logging::StructuredLogger;
using logging::log_event;
using protocol::ResponseBody;
using protocol::ResponsePayload;
using protocol::SignalMessage;
using protocol::SignalType;

SignalMessage invalid_request(std::uint32_t request_id) {
    return protocol::make_response(request_id, make_error(ErrorCode::InvalidArgument, "malformed request"));
}

template <typename T>
SignalMessage respond(std::uint32_t request_id, const Result<T>& result, ResponseBody body) {
    auto message = protocol::make_response(request_id, result.status);
    if (!result.ok()) {
        return message;
    }
    auto& payload = std::get<ResponsePayload>(message.payload);
    payload.body = body;
    if constexpr (std::is_same_v<T, FileInfo>) {
        payload.info = *result.value;
    } else if constexpr (std::is_same_v<T, std::vector<SeederInfo>>) {
        payload.seeders = *result.value;
    } else if constexpr (std::is_same_v<T, std::vector<PrincipalId>>) {
        payload.principals = *result.value;
    }
    return message;
}

}  // namespace

SignalRouter::SignalRouter(FileRegistry& registry)
    : registry_(registry) {
    registry_.set_event_sink([this](const RegistryEvent& event) { on_registry_event(event); });
}

SignalRouter::~SignalRouter() {
    registry_.set_event_sink({});
}

void SignalRouter::connect(const DeviceKey& device) {
    std::scoped_lock lock(mutex_);
    online_[device.principal].insert(device.device);
}

void SignalRouter::disconnect(const DeviceKey& device) {
    {
        std::scoped_lock lock(mutex_);
        const auto it = online_.find(device.principal);
        if (it != online_.end()) {
            it->second.erase(device.device);
            if (it->second.empty()) {
                online_.erase(it);
            }
        }
    }
    registry_.on_disconnect(device);
}

bool SignalRouter::is_online(const DeviceKey& device) const {
    std::scoped_lock lock(mutex_);
    const auto it = online_.find(device.principal);
    return it != online_.end() && it->second.contains(device.device);
}

std::vector<DeviceKey> SignalRouter::online_devices(const PrincipalId& principal) const {
    std::scoped_lock lock(mutex_);
    std::vector<DeviceKey> devices;
    const auto it = online_.find(principal);
    if (it == online_.end()) {
        return devices;
    }
    for (const auto& device : it->second) {
        devices.push_back(DeviceKey{principal, device});
    }
    return devices;
}

SignalMessage SignalRouter::handle(const DeviceKey& caller, const SignalMessage& request) {
    const auto id = request.request_id;
    switch (request.type) {
        case SignalType::Announce: {
            const auto* body = std::get_if<protocol::AnnouncePayload>(&request.payload);
            if (body == nullptr) {
                return invalid_request(id);
            }
            return respond(id, registry_.announce(caller, body->request), ResponseBody::File);
        }
        case SignalType::UpdateChunks: {
            const auto* body = std::get_if<protocol::ChunkListPayload>(&request.payload);
            if (body == nullptr) {
                return invalid_request(id);
            }
            return protocol::make_response(
                id, registry_.update_chunks(caller, body->file_id, body->chunks, body->active_uploads));
        }
        case SignalType::RegisterLeecher: {
            const auto* body = std::get_if<protocol::ChunkListPayload>(&request.payload);
            if (body == nullptr) {
                return invalid_request(id);
            }
            return protocol::make_response(id, registry_.register_leecher(caller, body->file_id, body->chunks));
        }
        case SignalType::GetInfo:
        case SignalType::ListSeeders:
        case SignalType::Unannounce:
        case SignalType::UnregisterLeecher: {
            const auto* body = std::get_if<protocol::FileQueryPayload>(&request.payload);
            if (body == nullptr) {
                return invalid_request(id);
            }
            if (request.type == SignalType::GetInfo) {
                return respond(id, registry_.get_info(caller.principal, body->file_id), ResponseBody::File);
            }
            if (request.type == SignalType::ListSeeders) {
                return respond(id, registry_.list_seeders(caller.principal, body->file_id), ResponseBody::Seeders);
            }
            if (request.type == SignalType::Unannounce) {
                return protocol::make_response(id, registry_.unannounce(caller, body->file_id));
            }
            return protocol::make_response(id, registry_.unregister_leecher(caller, body->file_id));
        }
        case SignalType::ShareUpdate: {
            const auto* body = std::get_if<protocol::ShareUpdatePayload>(&request.payload);
            if (body == nullptr) {
                return invalid_request(id);
            }
            return respond(id,
                           registry_.share_update(caller.principal, body->file_id, body->action, body->targets),
                           ResponseBody::Principals);
        }
        case SignalType::Offer:
        case SignalType::Answer:
        case SignalType::IceCandidate:
            return relay(caller, request);
        default:
            return invalid_request(id);
    }
}

std::vector<OutboundSignal> SignalRouter::take_outbox() {
    std::scoped_lock lock(mutex_);
    std::vector<OutboundSignal> drained;
    drained.swap(outbox_);
    return drained;
}

SignalMessage SignalRouter::relay(const DeviceKey& caller, const SignalMessage& request) {
    const auto* body = std::get_if<protocol::RelayPayload>(&request.payload);
    if (body == nullptr || body->to.principal.empty()) {
        return invalid_request(request.request_id);
    }

    // Authorization is re-checked on every hop; a peer's claim to be on the share list is never trusted.
    const auto members = registry_.shared_with(body->file_id);
    const auto is_member = [&](const PrincipalId& principal) {
        return members.has_value() && std::find(members->begin(), members->end(), principal) != members->end();
    };
    if (!is_member(caller.principal) || !is_member(body->to.principal)) {
        log_event(StructuredLogger::Level::Warning,
                  "signaling.relay_denied",
                  {{"file_id", body->file_id},
                   {"from", device_key_to_string(caller)},
                   {"to", device_key_to_string(body->to)}});
        return protocol::make_response(request.request_id, make_error(ErrorCode::AccessDenied, "access denied"));
    }

    std::vector<DeviceKey> targets;
    if (body->to.device.empty()) {
        targets = online_devices(body->to.principal);
    } else if (is_online(body->to)) {
        targets.push_back(body->to);
    }
    if (targets.empty()) {
        return protocol::make_response(request.request_id, make_error(ErrorCode::Unavailable, "target offline"));
    }

    for (const auto& target : targets) {
        protocol::RelayPayload forwarded = *body;
        forwarded.from = caller;
        forwarded.to = target;
        SignalMessage message{};
        message.type = request.type;
        message.payload = std::move(forwarded);
        queue(target, std::move(message));
    }
    return protocol::make_response(request.request_id, make_ok());
}

void SignalRouter::on_registry_event(const RegistryEvent& event) {
    SignalMessage message{};
    message.type = protocol::push_signal_type(event.notification.kind);
    message.payload = protocol::to_notify(event.notification);

    std::scoped_lock lock(mutex_);
    for (const auto& principal : event.recipients) {
        const auto it = online_.find(principal);
        if (it == online_.end()) {
            continue;
        }
        for (const auto& device : it->second) {
            outbox_.push_back(OutboundSignal{DeviceKey{principal, device}, message});
        }
    }
}

void SignalRouter::queue(const DeviceKey& target, SignalMessage message) {
    std::scoped_lock lock(mutex_);
    outbox_.push_back(OutboundSignal{target, std::move(message)});
}

}  // namespace swarmshare::coordinator
