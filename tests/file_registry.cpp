#include "swarmshare/coordinator/FileRegistry.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <numeric>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

const std::string kChecksum(64, 'a');
const std::string kOtherChecksum(64, 'b');

std::vector<swarmshare::ChunkIndex> all_chunks(std::uint32_t count) {
    std::vector<swarmshare::ChunkIndex> chunks(count);
    std::iota(chunks.begin(), chunks.end(), 0u);
    return chunks;
}

swarmshare::AnnounceRequest make_announce(const swarmshare::FileId& file_id, const std::string& checksum) {
    swarmshare::AnnounceRequest request{};
    request.file_id = file_id;
    request.file_size = 1048576;
    request.checksum = checksum;
    request.chunk_count = 16;
    request.available_chunks = all_chunks(16);
    return request;
}

bool has_event(const std::vector<swarmshare::coordinator::RegistryEvent>& events,
               swarmshare::PushKind kind,
               const swarmshare::PrincipalId& recipient) {
    return std::any_of(events.begin(), events.end(), [&](const auto& event) {
        return event.notification.kind == kind &&
               std::find(event.recipients.begin(), event.recipients.end(), recipient) != event.recipients.end();
    });
}

}  // namespace

int main() {
    using swarmshare::DeviceKey;
    using swarmshare::ErrorCode;
    using swarmshare::PushKind;

    auto now = std::chrono::system_clock::now();
    swarmshare::Config config{};
    config.record_ttl = std::chrono::hours(24);
    config.orphan_record_ttl = std::chrono::hours(1);

    swarmshare::coordinator::FileRegistry registry(config, [&now]() { return now; });
    std::vector<swarmshare::coordinator::RegistryEvent> events;
    registry.set_event_sink([&events](const swarmshare::coordinator::RegistryEvent& event) { events.push_back(event); });

    const DeviceKey alice{"alice", "laptop"};
    const DeviceKey bob{"bob", "phone"};
    const DeviceKey carol{"carol", "desktop"};
    const swarmshare::FileId file_id = "5f2a9c0e7d4b81369a0c2e4f6b8d0a1c";

    // 1 MiB at 64 KiB per chunk.
    assert(swarmshare::chunk_count_for(1048576, config.chunk_size_bytes) == 16);

    const auto created = registry.announce(alice, make_announce(file_id, kChecksum));
    assert(created.ok());
    assert(created.value->chunk_count == 16);
    assert(created.value->chunk_quality == 100);
    assert(created.value->missing_chunks.empty());
    assert(created.value->creator == "alice");
    assert(registry.size() == 1);

    // A second announce under the same id with a different checksum is refused.
    const auto conflicting = registry.announce(alice, make_announce(file_id, kOtherChecksum));
    assert(!conflicting.ok());
    assert(conflicting.status.code == ErrorCode::ChecksumMismatch);

    // Outsiders learn nothing, not even that the file exists.
    const auto denied = registry.get_info("bob", file_id);
    assert(denied.status.code == ErrorCode::AccessDenied);
    const auto unknown = registry.get_info("bob", "00000000000000000000000000000000");
    assert(unknown.status.code == ErrorCode::AccessDenied);
    assert(denied.status.message == unknown.status.message);
    assert(registry.announce(carol, make_announce(file_id, kChecksum)).status.code == ErrorCode::AccessDenied);
    assert(registry.register_leecher(bob, file_id).code == ErrorCode::AccessDenied);

    events.clear();
    const auto added = registry.share_add("alice", file_id, {"bob"});
    assert(added.ok());
    assert(has_event(events, PushKind::FileAvailable, "bob"));

    const auto info = registry.get_info("bob", file_id);
    assert(info.ok());
    assert(info.value->chunk_quality == 100);
    assert(info.value->seeders.size() == 1);
    assert(info.value->seeders.front().device == alice);

    // Members may share onward; only the creator revokes others.
    assert(registry.share_add("bob", file_id, {"carol"}).ok());
    assert(registry.share_revoke("bob", file_id, {"carol"}).status.code == ErrorCode::PermissionDenied);

    // Leecher progress lands in the seeder roster as chunks arrive.
    assert(registry.register_leecher(bob, file_id).ok());
    assert(registry.update_chunks(bob, file_id, {0, 1, 2}).ok());
    assert(registry.update_chunks(bob, file_id, {99}).code == ErrorCode::InvalidArgument);
    auto seeders = registry.list_seeders("carol", file_id);
    assert(seeders.ok());
    assert(seeders.value->size() == 2);
    assert(registry.stats().leechers == 1);

    // Leechers are tracked per device; one device dropping off leaves the other registered.
    const DeviceKey bob_tablet{"bob", "tablet"};
    assert(registry.register_leecher(bob_tablet, file_id).ok());
    assert(registry.stats().leechers == 2);
    assert(registry.get_info("bob", file_id).value->leecher_count == 2);
    registry.on_disconnect(bob_tablet);
    assert(registry.stats().leechers == 1);
    assert(registry.get_info("bob", file_id).value->leecher_count == 1);

    // An empty report registers nothing, and withdraws a device that was serving.
    assert(registry.update_chunks(bob_tablet, file_id, {}).ok());
    assert(registry.list_seeders("carol", file_id).value->size() == 2);
    events.clear();
    assert(registry.update_chunks(bob, file_id, {}).ok());
    assert(registry.list_seeders("carol", file_id).value->size() == 1);
    assert(has_event(events, PushKind::SeedersUpdate, "carol"));

    // Reports replace the previous set rather than merging into it.
    assert(registry.update_chunks(bob, file_id, {0, 1, 2}).ok());
    assert(registry.update_chunks(bob, file_id, {0, 2}).ok());
    seeders = registry.list_seeders("carol", file_id);
    assert(seeders.value->size() == 2);
    for (const auto& seeder : *seeders.value) {
        if (seeder.device == bob) {
            assert(seeder.chunks == (std::vector<swarmshare::ChunkIndex>{0, 2}));
        }
    }

    // Revocation drops the principal from every roster and tells it so.
    events.clear();
    const auto revoked = registry.share_revoke("alice", file_id, {"bob"});
    assert(revoked.ok());
    assert(std::find(revoked.value->begin(), revoked.value->end(), "bob") == revoked.value->end());
    assert(has_event(events, PushKind::AccessRevoked, "bob"));
    assert(!registry.can_access("bob", file_id));
    seeders = registry.list_seeders("alice", file_id);
    assert(seeders.value->size() == 1);
    assert(registry.stats().leechers == 0);

    // Self-revoke always succeeds and skips the rate limit; the creator stays.
    assert(registry.share_revoke("carol", file_id, {"carol"}).ok());
    assert(!registry.can_access("carol", file_id));
    assert(registry.share_revoke("carol", "ffffffffffffffffffffffffffffffff", {"carol"}).ok());
    const auto self_creator = registry.share_revoke("alice", file_id, {"alice"});
    assert(self_creator.ok());
    assert(registry.can_access("alice", file_id));

    // Re-announce with the matching checksum refreshes the seeder entry.
    assert(registry.announce(alice, make_announce(file_id, kChecksum)).ok());

    // Orphan collection: no seeders for longer than the orphan TTL.
    registry.on_disconnect(alice);
    assert(registry.list_seeders("alice", file_id).value->empty());
    assert(registry.sweep_expired(now + 30min) == 0);
    assert(registry.sweep_expired(now + 61min) == 1);
    assert(registry.size() == 0);
    assert(registry.get_info("alice", file_id).status.code == ErrorCode::AccessDenied);

    // The creator's unannounce deletes the record and notifies the other members.
    const swarmshare::FileId second = "0a1b2c3d4e5f60718293a4b5c6d7e8f9";
    auto request = make_announce(second, kChecksum);
    request.shared_with = {"bob"};
    events.clear();
    assert(registry.announce(alice, request).ok());
    assert(has_event(events, PushKind::FileAvailable, "bob"));
    events.clear();
    assert(registry.unannounce(alice, second).ok());
    assert(has_event(events, PushKind::AccessRevoked, "bob"));
    assert(registry.size() == 0);

    // Records also expire after the plain TTL.
    const swarmshare::FileId third = "11112222333344445555666677778888";
    assert(registry.announce(alice, make_announce(third, kChecksum)).ok());
    now += 25h;
    assert(registry.sweep_expired() == 1);

    // Validation.
    auto bad = make_announce("bad id!", kChecksum);
    assert(registry.announce(alice, bad).status.code == ErrorCode::InvalidArgument);
    bad = make_announce(third, kChecksum);
    bad.chunk_count = 15;
    assert(registry.announce(alice, bad).status.code == ErrorCode::InvalidArgument);
    bad = make_announce(third, "abc");
    assert(registry.announce(alice, bad).status.code == ErrorCode::InvalidArgument);

    return 0;
}
