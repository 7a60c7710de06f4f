#pragma once

#include "swarmshare/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace swarmshare {

struct SeederInfo {
    DeviceKey device;
    std::vector<ChunkIndex> chunks;
    std::uint16_t upload_slots{0};
    std::uint16_t active_uploads{0};
};

// What the coordinator tells an authorized principal about a file. Never carries name or MIME type.
struct FileInfo {
    FileId file_id;
    std::uint64_t file_size{0};
    std::uint32_t chunk_count{0};
    std::uint32_t chunk_size{0};
    std::string checksum;
    PrincipalId creator;
    std::vector<PrincipalId> shared_with;
    std::uint8_t chunk_quality{0};
    std::vector<ChunkIndex> missing_chunks;
    std::vector<SeederInfo> seeders;
    std::uint32_t leecher_count{0};
};

struct AnnounceRequest {
    FileId file_id;
    std::uint64_t file_size{0};
    std::string checksum;
    std::uint32_t chunk_count{0};
    std::vector<ChunkIndex> available_chunks;
    std::vector<PrincipalId> shared_with;
    std::uint16_t upload_slots{0};
};

enum class ShareAction : std::uint8_t {
    Add,
    Revoke
};

enum class RelayKind : std::uint8_t {
    Offer,
    Answer,
    IceCandidate
};

// Transport negotiation message; the coordinator forwards the payload without reading it.
struct RelayEnvelope {
    RelayKind kind{RelayKind::Offer};
    FileId file_id;
    DeviceKey from;
    DeviceKey to;  // empty device addresses every online device of the principal
    std::string payload;
};

enum class PushKind : std::uint8_t {
    FileAvailable,
    SeedersUpdate,
    UploaderOnline,
    AccessRevoked
};

struct PushNotification {
    PushKind kind{PushKind::SeedersUpdate};
    FileId file_id;
    std::uint32_t seeder_count{0};
    std::uint8_t chunk_quality{0};
    // Union of every seeder's chunks; lets a stalled downloader decide whether to resume.
    std::vector<ChunkIndex> available_chunks;
};

struct RegistryStats {
    std::size_t files{0};
    std::size_t seeder_devices{0};
    std::size_t leechers{0};
    std::uint64_t bytes{0};
};

}  // namespace swarmshare
