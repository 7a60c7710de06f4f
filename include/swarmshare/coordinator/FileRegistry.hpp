#pragma once

#include "swarmshare/Config.hpp"
#include "swarmshare/Error.hpp"
#include "swarmshare/SwarmTypes.hpp"
#include "swarmshare/Types.hpp"
#include "swarmshare/coordinator/AccessController.hpp"
#include "swarmshare/core/ChunkBitmap.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace swarmshare::coordinator {

struct SeederState {
    ChunkBitmap chunks;
    std::uint16_t upload_slots{0};
    std::uint16_t active_uploads{0};
    std::chrono::system_clock::time_point last_seen{};
};

struct LeecherState {
    ChunkBitmap chunks;
    std::uint8_t progress{0};
    std::chrono::system_clock::time_point last_seen{};
};

// Authoritative per-file state. Holds no file name or MIME type.
struct FileRecord {
    FileId file_id;
    std::uint64_t file_size{0};
    std::uint32_t chunk_count{0};
    std::uint32_t chunk_size{0};
    std::string checksum;
    PrincipalId checksum_set_by;
    std::chrono::system_clock::time_point checksum_set_at{};
    ShareList shared_with;
    std::map<PrincipalId, std::map<DeviceId, SeederState>> seeders;
    std::map<PrincipalId, std::map<DeviceId, LeecherState>> leechers;
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point last_activity_at{};
    std::chrono::system_clock::time_point expires_at{};
    // Set while the seeder roster is empty; drives orphan collection.
    std::optional<std::chrono::system_clock::time_point> no_seeders_since;

    [[nodiscard]] const PrincipalId& creator() const noexcept { return shared_with.creator(); }
};

struct RegistryEvent {
    std::vector<PrincipalId> recipients;
    PushNotification notification;
};

// Coordinator-side swarm registry. Records live in an arena keyed by fileId; each record carries its
// own reader/writer lock so unrelated files never contend, and no operation holds two record locks.
class FileRegistry {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using EventSink = std::function<void(const RegistryEvent&)>;

    explicit FileRegistry(Config config = {}, Clock clock = {});

    // Events are delivered after all registry locks are released.
    void set_event_sink(EventSink sink);

    Result<FileInfo> announce(const DeviceKey& caller, const AnnounceRequest& request);
    // The reported set replaces the device's previous one. An empty set withdraws the device from
    // the seeder roster, or registers nothing when it was not listed.
    Status update_chunks(const DeviceKey& caller,
                         const FileId& file_id,
                         const std::vector<ChunkIndex>& chunks,
                         std::uint16_t active_uploads = 0);
    Result<FileInfo> get_info(const PrincipalId& caller, const FileId& file_id) const;
    Result<std::vector<SeederInfo>> list_seeders(const PrincipalId& caller, const FileId& file_id) const;

    // Returns the resulting share list.
    Result<std::vector<PrincipalId>> share_update(const PrincipalId& caller,
                                                  const FileId& file_id,
                                                  ShareAction action,
                                                  const std::vector<PrincipalId>& targets);
    Result<std::vector<PrincipalId>> share_add(const PrincipalId& caller,
                                               const FileId& file_id,
                                               const std::vector<PrincipalId>& targets);
    Result<std::vector<PrincipalId>> share_revoke(const PrincipalId& caller,
                                                  const FileId& file_id,
                                                  const std::vector<PrincipalId>& targets);

    Status register_leecher(const DeviceKey& caller, const FileId& file_id, const std::vector<ChunkIndex>& chunks = {});
    Status unregister_leecher(const DeviceKey& caller, const FileId& file_id);

    // Creator: deletes the record. Anyone else: leaves the seeder roster.
    Status unannounce(const DeviceKey& caller, const FileId& file_id);

    // Drops the device from every roster; records are kept.
    void on_disconnect(const DeviceKey& device);

    std::size_t sweep_expired();
    std::size_t sweep_expired(std::chrono::system_clock::time_point now);

    bool can_access(const PrincipalId& principal, const FileId& file_id) const;
    std::optional<std::vector<PrincipalId>> shared_with(const FileId& file_id) const;
    RegistryStats stats() const;
    std::size_t size() const;

private:
    struct Entry {
        mutable std::shared_mutex mutex;
        FileRecord record;
        bool erased{false};
    };
    using EntryPtr = std::shared_ptr<Entry>;

    EntryPtr find_entry(const FileId& file_id) const;
    std::vector<EntryPtr> snapshot_entries() const;
    bool erase_entry(const FileId& file_id, const EntryPtr& expected);

    std::chrono::system_clock::time_point now() const;
    void touch(FileRecord& record, std::chrono::system_clock::time_point now) const;
    Status validate_announce(const AnnounceRequest& request) const;

    static ChunkBitmap coverage(const FileRecord& record);
    static std::uint8_t chunk_quality(const FileRecord& record, const ChunkBitmap& covered);
    static std::size_t seeder_device_count(const FileRecord& record);
    static std::size_t leecher_device_count(const FileRecord& record);
    static bool erase_leecher(FileRecord& record, const DeviceKey& device);
    static std::vector<SeederInfo> seeder_infos(const FileRecord& record);
    static FileInfo make_info(const FileRecord& record);
    static PushNotification make_push(const FileRecord& record, PushKind kind);
    static void erase_seeder(FileRecord& record, const DeviceKey& device, std::chrono::system_clock::time_point now);

    void dispatch(std::vector<RegistryEvent> events) const;

    Config config_;
    Clock clock_;
    AccessController access_;

    std::unordered_map<FileId, EntryPtr> entries_;
    mutable std::shared_mutex entries_mutex_;

    EventSink sink_;
    mutable std::mutex sink_mutex_;
};

}  // namespace swarmshare::coordinator
