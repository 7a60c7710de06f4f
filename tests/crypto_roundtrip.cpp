#include "swarmshare/crypto/EncryptionService.hpp"

#include <cassert>
#include <cstdint>
#include <vector>

namespace {

swarmshare::ChunkData make_payload(std::size_t size) {
    swarmshare::ChunkData data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 31u + 7u) & 0xFFu);
    }
    return data;
}

}  // namespace

int main() {
    using swarmshare::crypto::EncryptionService;

    const auto key = EncryptionService::generate_key();
    const swarmshare::FileId file_id = "0f1e2d3c4b5a69788796a5b4c3d2e1f0";

    // Every small size covers each offset within the keystream block and around the tag;
    // past that, each 4 KiB step and its neighbours up to the full chunk size.
    std::vector<std::size_t> sizes;
    for (std::size_t size = 1; size <= 1024; ++size) {
        sizes.push_back(size);
    }
    for (std::size_t step = 4096; step <= 64u * 1024u; step += 4096) {
        sizes.push_back(step - 1);
        sizes.push_back(step);
        if (step < 64u * 1024u) {
            sizes.push_back(step + 1);
        }
    }
    for (const auto size : sizes) {
        const auto plaintext = make_payload(size);
        const auto chunk = EncryptionService::encrypt_chunk(key, file_id, 3, plaintext);
        assert(chunk.file_id == file_id);
        assert(chunk.chunk_index == 3);
        assert(chunk.ciphertext.size() == size + swarmshare::crypto::kChunkTagSize);

        const auto decrypted = EncryptionService::decrypt_chunk(key, chunk);
        assert(decrypted.has_value());
        assert(*decrypted == plaintext);
    }

    const auto plaintext = make_payload(512);
    const auto chunk = EncryptionService::encrypt_chunk(key, file_id, 0, plaintext);

    // Fresh IV per chunk.
    const auto again = EncryptionService::encrypt_chunk(key, file_id, 0, plaintext);
    assert(again.iv != chunk.iv);
    assert(again.ciphertext != chunk.ciphertext);

    auto wrong_key = key;
    wrong_key.bytes[0] ^= 0x01u;
    assert(!EncryptionService::decrypt_chunk(wrong_key, chunk).has_value());

    auto flipped = chunk;
    flipped.ciphertext[10] ^= 0x80u;
    assert(!EncryptionService::decrypt_chunk(key, flipped).has_value());

    auto moved = chunk;
    moved.chunk_index = 1;
    assert(!EncryptionService::decrypt_chunk(key, moved).has_value());

    auto renamed = chunk;
    renamed.file_id = "00000000000000000000000000000000";
    assert(!EncryptionService::decrypt_chunk(key, renamed).has_value());

    const auto text = swarmshare::crypto::file_key_to_string(key);
    const auto parsed = swarmshare::crypto::file_key_from_string(text);
    assert(parsed.has_value());
    assert(*parsed == key);
    assert(!swarmshare::crypto::file_key_from_string("not-a-key").has_value());

    return 0;
}
