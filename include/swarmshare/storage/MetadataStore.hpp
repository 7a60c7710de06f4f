#pragma once

#include "swarmshare/Types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace swarmshare::storage {

enum class LocalFileStatus : std::uint8_t {
    Uploading,
    Seeding,
    Downloading,
    Paused,
    Partial,
    Complete
};

std::string_view local_file_status_name(LocalFileStatus status) noexcept;
std::optional<LocalFileStatus> local_file_status_from_name(std::string_view name) noexcept;

// One row of the device-local table. Name, MIME type and key never leave this device except
// through the out-of-band notification.
struct LocalFileEntry {
    FileId file_id;
    LocalFileStatus status{LocalFileStatus::Downloading};
    std::string checksum;
    std::uint32_t chunk_count{0};
    std::uint64_t file_size{0};
    std::vector<PrincipalId> shared_with;
    std::string file_key;
    std::string file_name;
    std::string mime_type;
    std::string output_path;
    std::string sender_id;
};

// Keyed by fileId. When a path is given every mutation rewrites it as tab-separated text.
class MetadataStore {
public:
    MetadataStore() = default;
    explicit MetadataStore(std::filesystem::path path);

    // Reads the backing file; returns false when it exists but cannot be parsed.
    bool load();

    void upsert(LocalFileEntry entry);
    std::optional<LocalFileEntry> get(const FileId& file_id) const;
    bool set_status(const FileId& file_id, LocalFileStatus status);
    bool update_shared_with(const FileId& file_id, std::vector<PrincipalId> shared_with);
    bool remove(const FileId& file_id);
    std::vector<LocalFileEntry> list() const;

private:
    void save_locked() const;

    std::filesystem::path path_;
    std::map<FileId, LocalFileEntry> entries_;
    mutable std::mutex mutex_;
};

}  // namespace swarmshare::storage
