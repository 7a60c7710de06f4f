#pragma once

#include "swarmshare/Error.hpp"
#include "swarmshare/SwarmTypes.hpp"
#include "swarmshare/Types.hpp"
#include "swarmshare/protocol/Signal.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace swarmshare::network {

// Client side of the coordinator signaling channel. Implementations only move SignalMessages;
// request encoding and response decoding live here.
//
// Handlers run on the link's delivery thread. They must return quickly and must not issue link
// requests themselves; hand the work to another thread instead.
class CoordinatorLink {
public:
    using PushHandler = std::function<void(const PushNotification&)>;
    using RelayHandler = std::function<void(const RelayEnvelope&)>;
    using DisconnectHandler = std::function<void()>;

    explicit CoordinatorLink(DeviceKey self);
    virtual ~CoordinatorLink() = default;

    CoordinatorLink(const CoordinatorLink&) = delete;
    CoordinatorLink& operator=(const CoordinatorLink&) = delete;

    [[nodiscard]] const DeviceKey& self() const noexcept { return self_; }

    virtual Status connect() = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool connected() const = 0;

    Result<FileInfo> announce(const AnnounceRequest& request);
    Status update_chunks(const FileId& file_id, const std::vector<ChunkIndex>& chunks, std::uint16_t active_uploads);
    Result<FileInfo> get_info(const FileId& file_id);
    Result<std::vector<SeederInfo>> list_seeders(const FileId& file_id);
    Result<std::vector<PrincipalId>> share_update(const FileId& file_id,
                                                  ShareAction action,
                                                  const std::vector<PrincipalId>& targets);
    Status unannounce(const FileId& file_id);
    Status register_leecher(const FileId& file_id, const std::vector<ChunkIndex>& chunks);
    Status unregister_leecher(const FileId& file_id);
    Status relay(const RelayEnvelope& envelope);

    void set_push_handler(PushHandler handler);
    void set_relay_handler(RelayHandler handler);
    void set_disconnect_handler(DisconnectHandler handler);

protected:
    // Sends one request and waits for its response; the request id is assigned by the implementation.
    virtual Result<protocol::ResponsePayload> exchange(protocol::SignalMessage request) = 0;

    // Routes a server-initiated message (push or relay) to the registered handler.
    void deliver(const protocol::SignalMessage& message);
    void notify_disconnected();

private:
    Result<protocol::ResponsePayload> call(protocol::SignalType type, protocol::SignalPayload payload);

    DeviceKey self_;
    mutable std::mutex handler_mutex_;
    PushHandler push_handler_;
    RelayHandler relay_handler_;
    DisconnectHandler disconnect_handler_;
};

}  // namespace swarmshare::network
