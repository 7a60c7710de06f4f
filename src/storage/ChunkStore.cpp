#include "swarmshare/storage/ChunkStore.hpp"

#include "swarmshare/logging/StructuredLogger.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <fstream>
#include <utility>

namespace swarmshare::storage {

namespace {

using logging::StructuredLogger;
using logging::log_event;

constexpr std::array<char, 4> kChunkMagic{'S', 'S', 'C', 'K'};
constexpr std::uint8_t kChunkFormatVersion = 1;
constexpr std::string_view kChunkExtension = ".chunk";

void write_u32(std::ofstream& stream, std::uint32_t value) {
    const std::array<char, 4> bytes{
        static_cast<char>((value >> 24) & 0xFFu),
        static_cast<char>((value >> 16) & 0xFFu),
        static_cast<char>((value >> 8) & 0xFFu),
        static_cast<char>(value & 0xFFu),
    };
    stream.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

bool read_u32(std::ifstream& stream, std::uint32_t& value) {
    std::array<unsigned char, 4> bytes{};
    stream.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!stream) {
        return false;
    }
    value = (static_cast<std::uint32_t>(bytes[0]) << 24) | (static_cast<std::uint32_t>(bytes[1]) << 16) |
            (static_cast<std::uint32_t>(bytes[2]) << 8) | static_cast<std::uint32_t>(bytes[3]);
    return true;
}

std::optional<ChunkIndex> parse_chunk_file_name(const std::filesystem::path& path) {
    if (path.extension() != kChunkExtension) {
        return std::nullopt;
    }
    const auto stem = path.stem().string();
    ChunkIndex index = 0;
    const auto* begin = stem.data();
    const auto* end = stem.data() + stem.size();
    const auto [ptr, ec] = std::from_chars(begin, end, index);
    if (ec != std::errc{} || ptr != end || stem.empty()) {
        return std::nullopt;
    }
    return index;
}

}  // namespace

ChunkStore::ChunkStore(Config config)
    : config_(std::move(config)),
      persistent_enabled_(config_.storage_persistent_enabled),
      wipe_on_delete_(config_.storage_wipe_on_delete),
      wipe_passes_(std::max<std::uint8_t>(config_.storage_wipe_passes, static_cast<std::uint8_t>(1))) {
    if (persistent_enabled_) {
        const auto base = std::filesystem::path(config_.storage_directory.empty() ? "storage" : config_.storage_directory);
        storage_root_ = base / "chunks";
        if (!ensure_directory(storage_root_)) {
            log_event(StructuredLogger::Level::Warning,
                      "store.persistence_disabled",
                      {{"path", storage_root_.string()}});
            persistent_enabled_ = false;
        }
    }
}

StoreOutcome ChunkStore::put(crypto::EncryptedChunk chunk) {
    std::scoped_lock lock(mutex_);
    auto& file = files_[chunk.file_id];
    const auto index = chunk.chunk_index;

    auto outcome = StoreOutcome::Stored;
    const auto existing = file.find(index);
    if (existing != file.end()) {
        const auto previous_size = existing->second.chunk.ciphertext.size();
        if (previous_size == chunk.ciphertext.size()) {
            return StoreOutcome::Duplicate;
        }
        log_event(StructuredLogger::Level::Warning,
                  "store.chunk_conflict",
                  {{"file_id", chunk.file_id},
                   {"chunk", std::to_string(index)},
                   {"stored_bytes", std::to_string(previous_size)},
                   {"incoming_bytes", std::to_string(chunk.ciphertext.size())}});
        if (existing->second.persisted) {
            secure_wipe_file(chunk_path(chunk.file_id, index));
        }
        outcome = StoreOutcome::Replaced;
    }

    StoredChunk stored{};
    stored.persisted = persistent_enabled_ && persist_chunk(chunk);
    stored.chunk = std::move(chunk);
    if (outcome == StoreOutcome::Stored) {
        ++total_chunks_;
    }
    file.insert_or_assign(index, std::move(stored));
    return outcome;
}

std::optional<crypto::EncryptedChunk> ChunkStore::get(const FileId& file_id, ChunkIndex index) const {
    std::scoped_lock lock(mutex_);
    const auto file = files_.find(file_id);
    if (file == files_.end()) {
        return std::nullopt;
    }
    const auto it = file->second.find(index);
    if (it == file->second.end()) {
        return std::nullopt;
    }
    return it->second.chunk;
}

bool ChunkStore::contains(const FileId& file_id, ChunkIndex index) const {
    std::scoped_lock lock(mutex_);
    const auto file = files_.find(file_id);
    return file != files_.end() && file->second.contains(index);
}

std::vector<ChunkIndex> ChunkStore::indices(const FileId& file_id) const {
    std::scoped_lock lock(mutex_);
    std::vector<ChunkIndex> result;
    const auto file = files_.find(file_id);
    if (file == files_.end()) {
        return result;
    }
    result.reserve(file->second.size());
    for (const auto& [index, _] : file->second) {
        result.push_back(index);
    }
    return result;
}

std::size_t ChunkStore::chunk_count(const FileId& file_id) const {
    std::scoped_lock lock(mutex_);
    const auto file = files_.find(file_id);
    return file == files_.end() ? 0 : file->second.size();
}

bool ChunkStore::erase(const FileId& file_id, ChunkIndex index) {
    std::scoped_lock lock(mutex_);
    const auto file = files_.find(file_id);
    if (file == files_.end()) {
        return false;
    }
    const auto it = file->second.find(index);
    if (it == file->second.end()) {
        return false;
    }
    if (it->second.persisted) {
        secure_wipe_file(chunk_path(file_id, index));
    }
    file->second.erase(it);
    --total_chunks_;
    if (file->second.empty()) {
        files_.erase(file);
    }
    return true;
}

std::size_t ChunkStore::remove_file(const FileId& file_id) {
    std::scoped_lock lock(mutex_);
    std::size_t removed = 0;
    const auto file = files_.find(file_id);
    if (file != files_.end()) {
        for (const auto& [index, stored] : file->second) {
            if (stored.persisted) {
                secure_wipe_file(chunk_path(file_id, index));
            }
        }
        removed = file->second.size();
        total_chunks_ -= removed;
        files_.erase(file);
    }

    if (persistent_enabled_) {
        // Chunks left behind by an earlier process are not in memory.
        std::error_code ec;
        const auto directory = file_directory(file_id);
        if (std::filesystem::is_directory(directory, ec)) {
            for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
                secure_wipe_file(entry.path());
            }
            std::filesystem::remove_all(directory, ec);
        }
    }
    return removed;
}

std::size_t ChunkStore::load_persisted(const FileId& file_id) {
    if (!persistent_enabled_) {
        return 0;
    }

    std::scoped_lock lock(mutex_);
    std::error_code ec;
    const auto directory = file_directory(file_id);
    if (!std::filesystem::is_directory(directory, ec)) {
        return 0;
    }

    std::size_t loaded = 0;
    auto& file = files_[file_id];
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        const auto index = parse_chunk_file_name(entry.path());
        if (!index.has_value() || file.contains(*index)) {
            continue;
        }
        auto chunk = read_chunk_file(entry.path(), file_id, *index);
        if (!chunk.has_value()) {
            log_event(StructuredLogger::Level::Warning,
                      "store.chunk_unreadable",
                      {{"file_id", file_id}, {"path", entry.path().string()}});
            continue;
        }
        StoredChunk stored{};
        stored.chunk = std::move(*chunk);
        stored.persisted = true;
        file.emplace(*index, std::move(stored));
        ++total_chunks_;
        ++loaded;
    }
    if (file.empty()) {
        files_.erase(file_id);
    }
    return loaded;
}

std::size_t ChunkStore::size() const noexcept {
    std::scoped_lock lock(mutex_);
    return total_chunks_;
}

std::filesystem::path ChunkStore::file_directory(const FileId& file_id) const {
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(file_id.data());
    return storage_root_ / to_hex(std::span<const std::uint8_t>(bytes, file_id.size()));
}

std::filesystem::path ChunkStore::chunk_path(const FileId& file_id, ChunkIndex index) const {
    return file_directory(file_id) / (std::to_string(index) + std::string(kChunkExtension));
}

bool ChunkStore::ensure_directory(const std::filesystem::path& path) const {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return std::filesystem::is_directory(path, ec);
    }
    return std::filesystem::create_directories(path, ec);
}

bool ChunkStore::persist_chunk(const crypto::EncryptedChunk& chunk) const {
    if (!ensure_directory(file_directory(chunk.file_id))) {
        return false;
    }

    const auto path = chunk_path(chunk.file_id, chunk.chunk_index);
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    if (!stream) {
        return false;
    }

    stream.write(kChunkMagic.data(), static_cast<std::streamsize>(kChunkMagic.size()));
    stream.put(static_cast<char>(kChunkFormatVersion));
    stream.write(reinterpret_cast<const char*>(chunk.iv.data()), static_cast<std::streamsize>(chunk.iv.size()));
    stream.write(reinterpret_cast<const char*>(chunk.plaintext_hash.data()),
                 static_cast<std::streamsize>(chunk.plaintext_hash.size()));
    write_u32(stream, static_cast<std::uint32_t>(chunk.ciphertext.size()));
    stream.write(reinterpret_cast<const char*>(chunk.ciphertext.data()),
                 static_cast<std::streamsize>(chunk.ciphertext.size()));
    stream.flush();
    if (!stream) {
        stream.close();
        secure_wipe_file(path);
        log_event(StructuredLogger::Level::Warning,
                  "store.persist_failed",
                  {{"file_id", chunk.file_id}, {"chunk", std::to_string(chunk.chunk_index)}});
        return false;
    }
    return true;
}

std::optional<crypto::EncryptedChunk> ChunkStore::read_chunk_file(const std::filesystem::path& path,
                                                                  const FileId& file_id,
                                                                  ChunkIndex index) const {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::nullopt;
    }

    std::array<char, 4> magic{};
    stream.read(magic.data(), static_cast<std::streamsize>(magic.size()));
    const auto version = stream.get();
    if (!stream || magic != kChunkMagic || version != kChunkFormatVersion) {
        return std::nullopt;
    }

    crypto::EncryptedChunk chunk{};
    chunk.file_id = file_id;
    chunk.chunk_index = index;
    stream.read(reinterpret_cast<char*>(chunk.iv.data()), static_cast<std::streamsize>(chunk.iv.size()));
    stream.read(reinterpret_cast<char*>(chunk.plaintext_hash.data()),
                static_cast<std::streamsize>(chunk.plaintext_hash.size()));
    std::uint32_t length = 0;
    if (!stream || !read_u32(stream, length)) {
        return std::nullopt;
    }
    if (length < crypto::kChunkTagSize || length > config_.chunk_size_bytes + crypto::kChunkTagSize) {
        return std::nullopt;
    }
    chunk.ciphertext.resize(length);
    stream.read(reinterpret_cast<char*>(chunk.ciphertext.data()), static_cast<std::streamsize>(length));
    if (!stream) {
        return std::nullopt;
    }
    return chunk;
}

bool ChunkStore::secure_wipe_file(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return true;
    }

    if (wipe_on_delete_) {
        const auto size = std::filesystem::file_size(path, ec);
        if (!ec) {
            std::fstream stream(path, std::ios::binary | std::ios::in | std::ios::out);
            std::vector<char> buffer(4096, 0);
            for (std::uint8_t pass = 0; stream && pass < wipe_passes_; ++pass) {
                stream.seekp(0, std::ios::beg);
                std::uint64_t remaining = size;
                while (remaining > 0 && stream) {
                    const auto length = static_cast<std::streamsize>(std::min<std::uint64_t>(buffer.size(), remaining));
                    stream.write(buffer.data(), length);
                    remaining -= static_cast<std::uint64_t>(length);
                }
                stream.flush();
            }
        }
    }

    std::filesystem::remove(path, ec);
    return !std::filesystem::exists(path, ec);
}

}  // namespace swarmshare::storage
