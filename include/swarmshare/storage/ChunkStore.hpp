#pragma once

#include "swarmshare/Config.hpp"
#include "swarmshare/Types.hpp"
#include "swarmshare/crypto/EncryptionService.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace swarmshare::storage {

enum class StoreOutcome : std::uint8_t {
    Stored,
    Duplicate,  // same length already present; nothing written
    Replaced    // length conflict; the incoming copy won
};

// Encrypted chunks keyed by (fileId, chunkIndex). Only ciphertext is kept, in memory and
// optionally on disk under <storage_directory>/<hex fileId>/<index>.chunk.
class ChunkStore {
public:
    explicit ChunkStore(Config config = {});

    StoreOutcome put(crypto::EncryptedChunk chunk);
    std::optional<crypto::EncryptedChunk> get(const FileId& file_id, ChunkIndex index) const;
    bool contains(const FileId& file_id, ChunkIndex index) const;

    // Ascending.
    std::vector<ChunkIndex> indices(const FileId& file_id) const;
    std::size_t chunk_count(const FileId& file_id) const;

    bool erase(const FileId& file_id, ChunkIndex index);
    // Drops every chunk of the file, wiping persisted copies. Returns the number removed.
    std::size_t remove_file(const FileId& file_id);

    // Reads chunks persisted by an earlier process. Returns the number loaded.
    std::size_t load_persisted(const FileId& file_id);

    std::size_t size() const noexcept;
    bool persistent() const noexcept { return persistent_enabled_; }

private:
    struct StoredChunk {
        crypto::EncryptedChunk chunk;
        bool persisted{false};
    };
    using FileChunks = std::map<ChunkIndex, StoredChunk>;

    std::filesystem::path file_directory(const FileId& file_id) const;
    std::filesystem::path chunk_path(const FileId& file_id, ChunkIndex index) const;
    bool ensure_directory(const std::filesystem::path& path) const;
    bool persist_chunk(const crypto::EncryptedChunk& chunk) const;
    std::optional<crypto::EncryptedChunk> read_chunk_file(const std::filesystem::path& path,
                                                          const FileId& file_id,
                                                          ChunkIndex index) const;
    bool secure_wipe_file(const std::filesystem::path& path) const;

    Config config_;
    std::unordered_map<FileId, FileChunks> files_;
    std::size_t total_chunks_{0};
    bool persistent_enabled_{false};
    bool wipe_on_delete_{true};
    std::uint8_t wipe_passes_{1};
    std::filesystem::path storage_root_;
    mutable std::mutex mutex_;
};

}  // namespace swarmshare::storage
