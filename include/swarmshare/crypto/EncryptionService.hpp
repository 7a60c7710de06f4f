#pragma once

#include "swarmshare/Types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace swarmshare::crypto {

inline constexpr std::size_t kChunkIvSize = 12;
inline constexpr std::size_t kChunkTagSize = 16;

// Per-file symmetric key. Generated by the uploader and only ever carried by the
// out-of-band notification; the coordinator never sees it.
struct FileKey {
    std::array<std::uint8_t, 32> bytes{};

    bool operator==(const FileKey&) const = default;
};

std::string file_key_to_string(const FileKey& key);
std::optional<FileKey> file_key_from_string(std::string_view text);

struct EncryptedChunk {
    FileId file_id;
    ChunkIndex chunk_index{0};
    std::array<std::uint8_t, kChunkIvSize> iv{};
    ChunkData ciphertext;  // body followed by the 16-byte tag
    Digest plaintext_hash{};
};

// Authenticated chunk encryption: ChaCha20 body, truncated HMAC-SHA256 tag over
// (fileId, chunkIndex, iv, body). Sub-keys are derived from the FileKey so the
// cipher and MAC keys never coincide.
class EncryptionService {
public:
    static FileKey generate_key();
    static void random_bytes(std::span<std::uint8_t> buffer);

    static EncryptedChunk encrypt_chunk(const FileKey& key,
                                        const FileId& file_id,
                                        ChunkIndex index,
                                        std::span<const std::uint8_t> plaintext);

    // nullopt when the tag does not authenticate (wrong key, tampering, or a chunk
    // presented under a different fileId or index).
    static std::optional<ChunkData> decrypt_chunk(const FileKey& key, const EncryptedChunk& chunk);
};

}  // namespace swarmshare::crypto
