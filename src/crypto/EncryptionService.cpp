#include "swarmshare/crypto/EncryptionService.hpp"

#include "swarmshare/crypto/ChaCha20.hpp"
#include "swarmshare/crypto/HmacSha256.hpp"
#include "swarmshare/crypto/Sha256.hpp"

#include <algorithm>
#include <random>
#include <string_view>

namespace swarmshare::crypto {

namespace {

constexpr std::string_view kCipherLabel = "swarmshare/chunk/cipher";
constexpr std::string_view kMacLabel = "swarmshare/chunk/mac";

std::span<const std::uint8_t> as_bytes(std::string_view text) {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

struct ChunkKeys {
    Key cipher;
    Digest mac{};

    ~ChunkKeys() {
        cipher.bytes.fill(0);
        mac.fill(0);
    }
};

void derive_keys(const FileKey& key, ChunkKeys& out) {
    out.cipher.bytes = HmacSha256::compute(key.bytes, as_bytes(kCipherLabel));
    out.mac = HmacSha256::compute(key.bytes, as_bytes(kMacLabel));
}

void append_u32(HmacSha256& mac, std::uint32_t value) {
    const std::array<std::uint8_t, 4> bytes{
        static_cast<std::uint8_t>(value >> 24),
        static_cast<std::uint8_t>(value >> 16),
        static_cast<std::uint8_t>(value >> 8),
        static_cast<std::uint8_t>(value),
    };
    mac.update(bytes);
}

Digest compute_tag(const Digest& mac_key,
                   const FileId& file_id,
                   ChunkIndex index,
                   std::span<const std::uint8_t> iv,
                   std::span<const std::uint8_t> body) {
    HmacSha256 mac(mac_key);
    append_u32(mac, static_cast<std::uint32_t>(file_id.size()));
    mac.update(as_bytes(file_id));
    append_u32(mac, index);
    mac.update(iv);
    mac.update(body);
    return mac.finalize();
}

}  // namespace

std::string file_key_to_string(const FileKey& key) {
    return to_hex(key.bytes);
}

std::optional<FileKey> file_key_from_string(std::string_view text) {
    const auto bytes = from_hex(text);
    if (!bytes.has_value() || bytes->size() != FileKey{}.bytes.size()) {
        return std::nullopt;
    }
    FileKey key{};
    std::copy(bytes->begin(), bytes->end(), key.bytes.begin());
    return key;
}

void EncryptionService::random_bytes(std::span<std::uint8_t> buffer) {
    std::random_device rd;
    for (auto& byte : buffer) {
        byte = static_cast<std::uint8_t>(rd());
    }
}

FileKey EncryptionService::generate_key() {
    FileKey key{};
    random_bytes(key.bytes);
    return key;
}

EncryptedChunk EncryptionService::encrypt_chunk(const FileKey& key,
                                                const FileId& file_id,
                                                ChunkIndex index,
                                                std::span<const std::uint8_t> plaintext) {
    ChunkKeys keys;
    derive_keys(key, keys);

    EncryptedChunk chunk{};
    chunk.file_id = file_id;
    chunk.chunk_index = index;
    chunk.plaintext_hash = Sha256::digest(plaintext);

    // The index prefix keeps IVs distinct across chunks of one file; the random
    // suffix keeps a re-encrypted chunk from reusing its previous IV.
    chunk.iv[0] = static_cast<std::uint8_t>(index >> 24);
    chunk.iv[1] = static_cast<std::uint8_t>(index >> 16);
    chunk.iv[2] = static_cast<std::uint8_t>(index >> 8);
    chunk.iv[3] = static_cast<std::uint8_t>(index);
    random_bytes(std::span<std::uint8_t>(chunk.iv).subspan(4));

    Nonce nonce{};
    nonce.bytes = chunk.iv;

    chunk.ciphertext.resize(plaintext.size() + kChunkTagSize);
    const auto body = std::span<std::uint8_t>(chunk.ciphertext).first(plaintext.size());
    ChaCha20 cipher(keys.cipher, nonce, 1);
    cipher.process(plaintext, body);

    const auto tag = compute_tag(keys.mac, file_id, index, chunk.iv, body);
    std::copy_n(tag.begin(), kChunkTagSize, chunk.ciphertext.begin() + static_cast<std::ptrdiff_t>(plaintext.size()));
    return chunk;
}

std::optional<ChunkData> EncryptionService::decrypt_chunk(const FileKey& key, const EncryptedChunk& chunk) {
    if (chunk.ciphertext.size() < kChunkTagSize) {
        return std::nullopt;
    }

    ChunkKeys keys;
    derive_keys(key, keys);

    const auto sealed = std::span<const std::uint8_t>(chunk.ciphertext);
    const auto body = sealed.first(sealed.size() - kChunkTagSize);
    const auto tag = sealed.last(kChunkTagSize);

    const auto expected = compute_tag(keys.mac, chunk.file_id, chunk.chunk_index, chunk.iv, body);
    if (!constant_time_equal(std::span<const std::uint8_t>(expected.data(), kChunkTagSize), tag)) {
        return std::nullopt;
    }

    Nonce nonce{};
    nonce.bytes = chunk.iv;
    ChunkData plaintext(body.size());
    ChaCha20 cipher(keys.cipher, nonce, 1);
    cipher.process(body, plaintext);
    return plaintext;
}

}  // namespace swarmshare::crypto
