#include "swarmshare/coordinator/FileRegistry.hpp"

#include "swarmshare/integrity/IntegrityVerifier.hpp"
#include "swarmshare/logging/StructuredLogger.hpp"

#include <algorithm>
#include <utility>

namespace swarmshare::coordinator {

namespace {

using logging::StructuredLogger;
using logging::log_event;
using integrity::IntegrityVerifier;

// Same text whether the file is unknown or the caller is not on its share list.
constexpr const char* kAccessDenied = "access denied";

bool indices_in_range(const std::vector<ChunkIndex>& indices, std::uint32_t chunk_count) {
    return std::all_of(indices.begin(), indices.end(), [&](ChunkIndex index) { return index < chunk_count; });
}

std::string normalize_checksum(std::string_view checksum) {
    const auto digest = digest_from_string(checksum);
    return digest.has_value() ? digest_to_string(*digest) : std::string(checksum);
}

std::vector<PrincipalId> without(std::vector<PrincipalId> principals, const PrincipalId& excluded) {
    principals.erase(std::remove(principals.begin(), principals.end(), excluded), principals.end());
    return principals;
}

}  // namespace

FileRegistry::FileRegistry(Config config, Clock clock)
    : config_(std::move(config)), clock_(std::move(clock)), access_(config_) {}

void FileRegistry::set_event_sink(EventSink sink) {
    std::scoped_lock lock(sink_mutex_);
    sink_ = std::move(sink);
}

Result<FileInfo> FileRegistry::announce(const DeviceKey& caller, const AnnounceRequest& request) {
    const auto status = validate_announce(request);
    if (!status.ok()) {
        return make_failure<FileInfo>(status);
    }

    const auto at = now();
    std::vector<RegistryEvent> events;

    while (true) {
        auto entry = find_entry(request.file_id);
        if (!entry) {
            auto created = std::make_shared<Entry>();
            auto& record = created->record;
            record.file_id = request.file_id;
            record.file_size = request.file_size;
            record.chunk_count = request.chunk_count;
            record.chunk_size = config_.chunk_size_bytes;
            record.checksum = normalize_checksum(request.checksum);
            record.checksum_set_by = caller.principal;
            record.checksum_set_at = at;
            record.shared_with = ShareList(caller.principal);
            record.created_at = at;
            touch(record, at);

            std::vector<PrincipalId> targets = without(request.shared_with, caller.principal);
            if (!targets.empty()) {
                const auto share_status = access_.authorize(record.shared_with, caller.principal, ShareAction::Add, targets);
                if (!share_status.ok()) {
                    return make_failure<FileInfo>(share_status);
                }
            }
            const auto change = access_.apply(record.shared_with, ShareAction::Add, targets);

            SeederState seeder{};
            seeder.chunks = ChunkBitmap::from_indices(request.chunk_count, request.available_chunks);
            seeder.upload_slots = request.upload_slots > 0 ? request.upload_slots : config_.seeder_upload_slots;
            seeder.last_seen = at;
            record.seeders[caller.principal][caller.device] = std::move(seeder);

            auto info = make_info(record);
            if (!change.added.empty()) {
                events.push_back(RegistryEvent{change.added, make_push(record, PushKind::FileAvailable)});
            }
            {
                std::unique_lock lock(entries_mutex_);
                if (!entries_.try_emplace(request.file_id, created).second) {
                    events.clear();
                    continue;
                }
            }

            log_event(StructuredLogger::Level::Info,
                      "registry.announce",
                      {{"file_id", request.file_id},
                       {"device", device_key_to_string(caller)},
                       {"created", "true"},
                       {"chunks", std::to_string(request.chunk_count)}});
            dispatch(std::move(events));
            return make_result(std::move(info));
        }

        std::unique_lock lock(entry->mutex);
        if (entry->erased) {
            continue;
        }
        auto& record = entry->record;
        if (!access_.can_access(record.shared_with, caller.principal)) {
            return make_failure<FileInfo>(ErrorCode::AccessDenied, kAccessDenied);
        }
        if (!IntegrityVerifier::checksums_equal(record.checksum, request.checksum)) {
            log_event(StructuredLogger::Level::Warning,
                      "registry.checksum_rejected",
                      {{"file_id", request.file_id}, {"device", device_key_to_string(caller)}});
            return make_failure<FileInfo>(ErrorCode::ChecksumMismatch, "checksum differs from the canonical value");
        }
        if (record.file_size != request.file_size || record.chunk_count != request.chunk_count) {
            return make_failure<FileInfo>(ErrorCode::InvalidArgument, "size does not match the existing record");
        }

        ShareChange change{};
        const auto targets = without(request.shared_with, caller.principal);
        if (!targets.empty()) {
            const auto share_status = access_.authorize(record.shared_with, caller.principal, ShareAction::Add, targets);
            if (!share_status.ok()) {
                return make_failure<FileInfo>(share_status);
            }
            change = access_.apply(record.shared_with, ShareAction::Add, targets);
        }

        const bool was_orphaned = seeder_device_count(record) == 0;
        auto& seeder = record.seeders[caller.principal][caller.device];
        seeder.chunks = ChunkBitmap::from_indices(record.chunk_count, request.available_chunks);
        seeder.upload_slots = request.upload_slots > 0 ? request.upload_slots : config_.seeder_upload_slots;
        seeder.active_uploads = 0;
        seeder.last_seen = at;
        record.no_seeders_since.reset();
        touch(record, at);

        if (!change.added.empty()) {
            events.push_back(RegistryEvent{change.added, make_push(record, PushKind::FileAvailable)});
        }
        const auto members = record.shared_with.members();
        if (was_orphaned && caller.principal == record.creator()) {
            events.push_back(RegistryEvent{without(members, caller.principal), make_push(record, PushKind::UploaderOnline)});
        }
        events.push_back(RegistryEvent{members, make_push(record, PushKind::SeedersUpdate)});

        auto info = make_info(record);
        lock.unlock();

        log_event(StructuredLogger::Level::Info,
                  "registry.announce",
                  {{"file_id", request.file_id},
                   {"device", device_key_to_string(caller)},
                   {"created", "false"},
                   {"chunks", std::to_string(request.available_chunks.size())}});
        dispatch(std::move(events));
        return make_result(std::move(info));
    }
}

Status FileRegistry::update_chunks(const DeviceKey& caller,
                                   const FileId& file_id,
                                   const std::vector<ChunkIndex>& chunks,
                                   std::uint16_t active_uploads) {
    const auto entry = find_entry(file_id);
    if (!entry) {
        return make_error(ErrorCode::AccessDenied, kAccessDenied);
    }

    std::vector<RegistryEvent> events;
    {
        std::unique_lock lock(entry->mutex);
        auto& record = entry->record;
        if (entry->erased || !access_.can_access(record.shared_with, caller.principal)) {
            return make_error(ErrorCode::AccessDenied, kAccessDenied);
        }
        if (!indices_in_range(chunks, record.chunk_count)) {
            return make_error(ErrorCode::InvalidArgument, "chunk index out of range");
        }

        const auto at = now();
        auto reported = ChunkBitmap::from_indices(record.chunk_count, chunks);
        const auto devices = record.seeders.find(caller.principal);
        const bool listed = devices != record.seeders.end() && devices->second.contains(caller.device);
        if (reported.empty()) {
            if (!listed) {
                return make_ok();
            }
            erase_seeder(record, caller, at);
            log_event(StructuredLogger::Level::Info,
                      "registry.seeder_withdrawn",
                      {{"file_id", file_id}, {"device", device_key_to_string(caller)}});
        } else {
            auto& seeder = record.seeders[caller.principal][caller.device];
            if (!listed) {
                seeder.upload_slots = config_.seeder_upload_slots;
            }
            seeder.chunks = reported;
            seeder.active_uploads = active_uploads;
            seeder.last_seen = at;
            record.no_seeders_since.reset();
        }

        if (const auto principal = record.leechers.find(caller.principal); principal != record.leechers.end()) {
            if (const auto leecher = principal->second.find(caller.device); leecher != principal->second.end()) {
                leecher->second.chunks = std::move(reported);
                leecher->second.progress = static_cast<std::uint8_t>(
                    record.chunk_count == 0 ? 0 : leecher->second.chunks.count() * 100u / record.chunk_count);
                leecher->second.last_seen = at;
            }
        }
        touch(record, at);

        events.push_back(RegistryEvent{record.shared_with.members(), make_push(record, PushKind::SeedersUpdate)});
    }

    dispatch(std::move(events));
    return make_ok();
}

Result<FileInfo> FileRegistry::get_info(const PrincipalId& caller, const FileId& file_id) const {
    const auto entry = find_entry(file_id);
    if (!entry) {
        return make_failure<FileInfo>(ErrorCode::AccessDenied, kAccessDenied);
    }
    std::shared_lock lock(entry->mutex);
    if (entry->erased || !access_.can_access(entry->record.shared_with, caller)) {
        return make_failure<FileInfo>(ErrorCode::AccessDenied, kAccessDenied);
    }
    return make_result(make_info(entry->record));
}

Result<std::vector<SeederInfo>> FileRegistry::list_seeders(const PrincipalId& caller, const FileId& file_id) const {
    const auto entry = find_entry(file_id);
    if (!entry) {
        return make_failure<std::vector<SeederInfo>>(ErrorCode::AccessDenied, kAccessDenied);
    }
    std::shared_lock lock(entry->mutex);
    if (entry->erased || !access_.can_access(entry->record.shared_with, caller)) {
        return make_failure<std::vector<SeederInfo>>(ErrorCode::AccessDenied, kAccessDenied);
    }
    return make_result(seeder_infos(entry->record));
}

Result<std::vector<PrincipalId>> FileRegistry::share_update(const PrincipalId& caller,
                                                            const FileId& file_id,
                                                            ShareAction action,
                                                            const std::vector<PrincipalId>& targets) {
    const bool self_revoke = action == ShareAction::Revoke && !targets.empty() &&
                             std::all_of(targets.begin(), targets.end(), [&](const PrincipalId& target) {
                                 return target == caller;
                             });
    if (!self_revoke) {
        const auto admitted = access_.admit(caller, now());
        if (!admitted.ok()) {
            log_event(StructuredLogger::Level::Warning,
                      "registry.share_rate_limited",
                      {{"file_id", file_id}, {"principal", caller}});
            return make_failure<std::vector<PrincipalId>>(admitted);
        }
    }

    const auto entry = find_entry(file_id);
    if (!entry) {
        if (self_revoke) {
            return make_result(std::vector<PrincipalId>{});
        }
        return make_failure<std::vector<PrincipalId>>(ErrorCode::AccessDenied, kAccessDenied);
    }

    std::vector<RegistryEvent> events;
    std::vector<PrincipalId> members;
    {
        std::unique_lock lock(entry->mutex);
        auto& record = entry->record;
        if (entry->erased) {
            if (self_revoke) {
                return make_result(std::vector<PrincipalId>{});
            }
            return make_failure<std::vector<PrincipalId>>(ErrorCode::AccessDenied, kAccessDenied);
        }

        const auto status = access_.authorize(record.shared_with, caller, action, targets);
        if (!status.ok()) {
            return make_failure<std::vector<PrincipalId>>(status);
        }
        const auto change = access_.apply(record.shared_with, action, targets);
        const auto at = now();
        for (const auto& removed : change.removed) {
            const auto devices = record.seeders.find(removed);
            if (devices != record.seeders.end()) {
                std::vector<DeviceId> ids;
                for (const auto& [device, _] : devices->second) {
                    ids.push_back(device);
                }
                for (const auto& device : ids) {
                    erase_seeder(record, DeviceKey{removed, device}, at);
                }
            }
            record.leechers.erase(removed);
        }
        record.last_activity_at = at;
        members = record.shared_with.members();

        if (!change.added.empty()) {
            events.push_back(RegistryEvent{change.added, make_push(record, PushKind::FileAvailable)});
        }
        if (!change.removed.empty()) {
            events.push_back(RegistryEvent{change.removed, make_push(record, PushKind::AccessRevoked)});
            events.push_back(RegistryEvent{members, make_push(record, PushKind::SeedersUpdate)});
        }

        log_event(StructuredLogger::Level::Info,
                  "registry.share_update",
                  {{"file_id", file_id},
                   {"principal", caller},
                   {"action", action == ShareAction::Add ? "add" : "revoke"},
                   {"added", std::to_string(change.added.size())},
                   {"removed", std::to_string(change.removed.size())}});
    }

    dispatch(std::move(events));
    return make_result(std::move(members));
}

Result<std::vector<PrincipalId>> FileRegistry::share_add(const PrincipalId& caller,
                                                         const FileId& file_id,
                                                         const std::vector<PrincipalId>& targets) {
    return share_update(caller, file_id, ShareAction::Add, targets);
}

Result<std::vector<PrincipalId>> FileRegistry::share_revoke(const PrincipalId& caller,
                                                            const FileId& file_id,
                                                            const std::vector<PrincipalId>& targets) {
    return share_update(caller, file_id, ShareAction::Revoke, targets);
}

Status FileRegistry::register_leecher(const DeviceKey& caller,
                                      const FileId& file_id,
                                      const std::vector<ChunkIndex>& chunks) {
    const auto entry = find_entry(file_id);
    if (!entry) {
        return make_error(ErrorCode::AccessDenied, kAccessDenied);
    }
    std::unique_lock lock(entry->mutex);
    auto& record = entry->record;
    if (entry->erased || !access_.can_access(record.shared_with, caller.principal)) {
        return make_error(ErrorCode::AccessDenied, kAccessDenied);
    }
    if (!indices_in_range(chunks, record.chunk_count)) {
        return make_error(ErrorCode::InvalidArgument, "chunk index out of range");
    }

    const auto at = now();
    auto& leecher = record.leechers[caller.principal][caller.device];
    leecher.chunks = ChunkBitmap::from_indices(record.chunk_count, chunks);
    leecher.progress = static_cast<std::uint8_t>(
        record.chunk_count == 0 ? 0 : leecher.chunks.count() * 100u / record.chunk_count);
    leecher.last_seen = at;
    touch(record, at);
    return make_ok();
}

Status FileRegistry::unregister_leecher(const DeviceKey& caller, const FileId& file_id) {
    const auto entry = find_entry(file_id);
    if (!entry) {
        return make_error(ErrorCode::AccessDenied, kAccessDenied);
    }
    std::unique_lock lock(entry->mutex);
    if (entry->erased || !access_.can_access(entry->record.shared_with, caller.principal)) {
        return make_error(ErrorCode::AccessDenied, kAccessDenied);
    }
    erase_leecher(entry->record, caller);
    entry->record.last_activity_at = now();
    return make_ok();
}

Status FileRegistry::unannounce(const DeviceKey& caller, const FileId& file_id) {
    const auto entry = find_entry(file_id);
    if (!entry) {
        return make_error(ErrorCode::AccessDenied, kAccessDenied);
    }

    std::vector<RegistryEvent> events;
    bool deleted = false;
    {
        std::unique_lock lock(entry->mutex);
        auto& record = entry->record;
        if (entry->erased || !access_.can_access(record.shared_with, caller.principal)) {
            return make_error(ErrorCode::AccessDenied, kAccessDenied);
        }

        if (caller.principal == record.creator()) {
            entry->erased = true;
            deleted = true;
            events.push_back(RegistryEvent{without(record.shared_with.members(), caller.principal),
                                           make_push(record, PushKind::AccessRevoked)});
        } else {
            erase_seeder(record, caller, now());
            record.last_activity_at = now();
            events.push_back(RegistryEvent{record.shared_with.members(), make_push(record, PushKind::SeedersUpdate)});
        }
    }

    if (deleted) {
        erase_entry(file_id, entry);
        log_event(StructuredLogger::Level::Info,
                  "registry.deleted",
                  {{"file_id", file_id}, {"principal", caller.principal}});
    }
    dispatch(std::move(events));
    return make_ok();
}

void FileRegistry::on_disconnect(const DeviceKey& device) {
    std::vector<RegistryEvent> events;
    const auto at = now();
    for (const auto& entry : snapshot_entries()) {
        std::unique_lock lock(entry->mutex);
        if (entry->erased) {
            continue;
        }
        auto& record = entry->record;
        bool changed = false;
        const auto devices = record.seeders.find(device.principal);
        if (devices != record.seeders.end() && devices->second.contains(device.device)) {
            erase_seeder(record, device, at);
            changed = true;
        }
        if (erase_leecher(record, device)) {
            changed = true;
        }
        if (changed) {
            events.push_back(RegistryEvent{record.shared_with.members(), make_push(record, PushKind::SeedersUpdate)});
        }
    }
    dispatch(std::move(events));
}

std::size_t FileRegistry::sweep_expired() {
    return sweep_expired(now());
}

std::size_t FileRegistry::sweep_expired(std::chrono::system_clock::time_point now) {
    std::vector<std::pair<FileId, EntryPtr>> expired;
    for (const auto& entry : snapshot_entries()) {
        std::unique_lock lock(entry->mutex);
        if (entry->erased) {
            continue;
        }
        const auto& record = entry->record;
        const bool ttl_elapsed = now >= record.expires_at;
        const bool orphaned = record.no_seeders_since.has_value() &&
                              now - *record.no_seeders_since >= config_.orphan_record_ttl;
        if (ttl_elapsed || orphaned) {
            entry->erased = true;
            expired.emplace_back(record.file_id, entry);
        }
    }

    for (const auto& [file_id, entry] : expired) {
        erase_entry(file_id, entry);
    }
    if (!expired.empty()) {
        log_event(StructuredLogger::Level::Info,
                  "registry.sweep",
                  {{"removed", std::to_string(expired.size())}, {"remaining", std::to_string(size())}});
    }
    return expired.size();
}

bool FileRegistry::can_access(const PrincipalId& principal, const FileId& file_id) const {
    const auto entry = find_entry(file_id);
    if (!entry) {
        return false;
    }
    std::shared_lock lock(entry->mutex);
    return !entry->erased && access_.can_access(entry->record.shared_with, principal);
}

std::optional<std::vector<PrincipalId>> FileRegistry::shared_with(const FileId& file_id) const {
    const auto entry = find_entry(file_id);
    if (!entry) {
        return std::nullopt;
    }
    std::shared_lock lock(entry->mutex);
    if (entry->erased) {
        return std::nullopt;
    }
    return entry->record.shared_with.members();
}

RegistryStats FileRegistry::stats() const {
    RegistryStats stats{};
    for (const auto& entry : snapshot_entries()) {
        std::shared_lock lock(entry->mutex);
        if (entry->erased) {
            continue;
        }
        ++stats.files;
        stats.seeder_devices += seeder_device_count(entry->record);
        stats.leechers += leecher_device_count(entry->record);
        stats.bytes += entry->record.file_size;
    }
    return stats;
}

std::size_t FileRegistry::size() const {
    std::shared_lock lock(entries_mutex_);
    return entries_.size();
}

FileRegistry::EntryPtr FileRegistry::find_entry(const FileId& file_id) const {
    std::shared_lock lock(entries_mutex_);
    const auto it = entries_.find(file_id);
    return it == entries_.end() ? nullptr : it->second;
}

std::vector<FileRegistry::EntryPtr> FileRegistry::snapshot_entries() const {
    std::shared_lock lock(entries_mutex_);
    std::vector<EntryPtr> result;
    result.reserve(entries_.size());
    for (const auto& [_, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

bool FileRegistry::erase_entry(const FileId& file_id, const EntryPtr& expected) {
    std::unique_lock lock(entries_mutex_);
    const auto it = entries_.find(file_id);
    if (it == entries_.end() || it->second != expected) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::chrono::system_clock::time_point FileRegistry::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

void FileRegistry::touch(FileRecord& record, std::chrono::system_clock::time_point now) const {
    record.last_activity_at = now;
    record.expires_at = now + config_.record_ttl;
}

Status FileRegistry::validate_announce(const AnnounceRequest& request) const {
    if (!is_valid_file_id(request.file_id)) {
        return make_error(ErrorCode::InvalidArgument, "invalid file id");
    }
    if (request.file_size == 0 || request.file_size > config_.max_file_size_bytes) {
        return make_error(ErrorCode::InvalidArgument, "file size out of range");
    }
    if (request.chunk_count != chunk_count_for(request.file_size, config_.chunk_size_bytes)) {
        return make_error(ErrorCode::InvalidArgument, "chunk count does not match file size");
    }
    if (!IntegrityVerifier::is_valid_checksum(request.checksum)) {
        return make_error(ErrorCode::InvalidArgument, "malformed checksum");
    }
    if (!indices_in_range(request.available_chunks, request.chunk_count)) {
        return make_error(ErrorCode::InvalidArgument, "chunk index out of range");
    }
    return make_ok();
}

ChunkBitmap FileRegistry::coverage(const FileRecord& record) {
    ChunkBitmap covered(record.chunk_count);
    for (const auto& [_, devices] : record.seeders) {
        for (const auto& [device_id, seeder] : devices) {
            covered.merge(seeder.chunks);
        }
    }
    return covered;
}

std::uint8_t FileRegistry::chunk_quality(const FileRecord& record, const ChunkBitmap& covered) {
    if (record.chunk_count == 0) {
        return 0;
    }
    return static_cast<std::uint8_t>(static_cast<std::uint64_t>(covered.count()) * 100u / record.chunk_count);
}

std::size_t FileRegistry::seeder_device_count(const FileRecord& record) {
    std::size_t count = 0;
    for (const auto& [_, devices] : record.seeders) {
        count += devices.size();
    }
    return count;
}

std::size_t FileRegistry::leecher_device_count(const FileRecord& record) {
    std::size_t count = 0;
    for (const auto& [_, devices] : record.leechers) {
        count += devices.size();
    }
    return count;
}

bool FileRegistry::erase_leecher(FileRecord& record, const DeviceKey& device) {
    const auto devices = record.leechers.find(device.principal);
    if (devices == record.leechers.end() || devices->second.erase(device.device) == 0) {
        return false;
    }
    if (devices->second.empty()) {
        record.leechers.erase(devices);
    }
    return true;
}

std::vector<SeederInfo> FileRegistry::seeder_infos(const FileRecord& record) {
    std::vector<SeederInfo> result;
    for (const auto& [principal, devices] : record.seeders) {
        for (const auto& [device, seeder] : devices) {
            SeederInfo info{};
            info.device = DeviceKey{principal, device};
            info.chunks = seeder.chunks.indices();
            info.upload_slots = seeder.upload_slots;
            info.active_uploads = seeder.active_uploads;
            result.push_back(std::move(info));
        }
    }
    return result;
}

FileInfo FileRegistry::make_info(const FileRecord& record) {
    const auto covered = coverage(record);
    FileInfo info{};
    info.file_id = record.file_id;
    info.file_size = record.file_size;
    info.chunk_count = record.chunk_count;
    info.chunk_size = record.chunk_size;
    info.checksum = record.checksum;
    info.creator = record.creator();
    info.shared_with = record.shared_with.members();
    info.chunk_quality = chunk_quality(record, covered);
    info.missing_chunks = covered.missing();
    info.seeders = seeder_infos(record);
    info.leecher_count = static_cast<std::uint32_t>(leecher_device_count(record));
    return info;
}

PushNotification FileRegistry::make_push(const FileRecord& record, PushKind kind) {
    PushNotification push{};
    push.kind = kind;
    push.file_id = record.file_id;
    if (kind == PushKind::AccessRevoked) {
        return push;
    }
    const auto covered = coverage(record);
    push.seeder_count = static_cast<std::uint32_t>(seeder_device_count(record));
    push.chunk_quality = chunk_quality(record, covered);
    push.available_chunks = covered.indices();
    return push;
}

void FileRegistry::erase_seeder(FileRecord& record, const DeviceKey& device, std::chrono::system_clock::time_point now) {
    const auto devices = record.seeders.find(device.principal);
    if (devices == record.seeders.end()) {
        return;
    }
    devices->second.erase(device.device);
    if (devices->second.empty()) {
        record.seeders.erase(devices);
    }
    if (seeder_device_count(record) == 0 && !record.no_seeders_since.has_value()) {
        record.no_seeders_since = now;
    }
}

void FileRegistry::dispatch(std::vector<RegistryEvent> events) const {
    if (events.empty()) {
        return;
    }
    EventSink sink;
    {
        std::scoped_lock lock(sink_mutex_);
        sink = sink_;
    }
    if (!sink) {
        return;
    }
    for (const auto& event : events) {
        if (!event.recipients.empty()) {
            sink(event);
        }
    }
}

}  // namespace swarmshare::coordinator
