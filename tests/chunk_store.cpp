#include "swarmshare/crypto/EncryptionService.hpp"
#include "swarmshare/storage/ChunkStore.hpp"

#include <cassert>
#include <filesystem>
#include <vector>

namespace {

swarmshare::crypto::EncryptedChunk make_chunk(const swarmshare::crypto::FileKey& key,
                                              const swarmshare::FileId& file_id,
                                              swarmshare::ChunkIndex index,
                                              std::size_t size,
                                              std::uint8_t fill) {
    const swarmshare::ChunkData plaintext(size, fill);
    return swarmshare::crypto::EncryptionService::encrypt_chunk(key, file_id, index, plaintext);
}

}  // namespace

int main() {
    using swarmshare::storage::ChunkStore;
    using swarmshare::storage::StoreOutcome;

    const auto key = swarmshare::crypto::EncryptionService::generate_key();
    const swarmshare::FileId file_id = "3c1f0d7a9e5b42c6a8f1e0d2b4c6a8e0";

    {
        ChunkStore store;
        assert(!store.persistent());

        const auto first = make_chunk(key, file_id, 2, 128, 0x11);
        assert(store.put(first) == StoreOutcome::Stored);
        assert(store.contains(file_id, 2));
        assert(store.size() == 1);

        // Same index, same length: the first copy stays.
        const auto duplicate = make_chunk(key, file_id, 2, 128, 0x22);
        assert(store.put(duplicate) == StoreOutcome::Duplicate);
        assert(store.get(file_id, 2)->ciphertext == first.ciphertext);
        assert(store.size() == 1);

        // Length conflict: the incoming copy replaces the stored one.
        const auto conflicting = make_chunk(key, file_id, 2, 96, 0x33);
        assert(store.put(conflicting) == StoreOutcome::Replaced);
        assert(store.get(file_id, 2)->ciphertext == conflicting.ciphertext);
        assert(store.size() == 1);

        assert(store.put(make_chunk(key, file_id, 0, 64, 0x01)) == StoreOutcome::Stored);
        assert(store.put(make_chunk(key, file_id, 5, 64, 0x05)) == StoreOutcome::Stored);
        const auto indices = store.indices(file_id);
        assert((indices == std::vector<swarmshare::ChunkIndex>{0, 2, 5}));
        assert(store.chunk_count(file_id) == 3);

        assert(store.erase(file_id, 5));
        assert(!store.erase(file_id, 5));
        assert(!store.get(file_id, 5).has_value());

        assert(store.remove_file(file_id) == 2);
        assert(store.size() == 0);
        assert(store.indices(file_id).empty());
    }

    swarmshare::Config config{};
    config.storage_persistent_enabled = true;
    config.storage_directory = (std::filesystem::temp_directory_path() / "swarmshare_chunk_store_test").string();
    std::filesystem::remove_all(config.storage_directory);

    const auto persisted = make_chunk(key, file_id, 7, 1024, 0x7A);
    {
        ChunkStore store(config);
        assert(store.persistent());
        assert(store.put(persisted) == StoreOutcome::Stored);
        assert(store.put(make_chunk(key, file_id, 8, 1024, 0x7B)) == StoreOutcome::Stored);
    }

    {
        ChunkStore reloaded(config);
        assert(reloaded.chunk_count(file_id) == 0);
        assert(reloaded.load_persisted(file_id) == 2);
        const auto chunk = reloaded.get(file_id, 7);
        assert(chunk.has_value());
        assert(chunk->ciphertext == persisted.ciphertext);
        assert(chunk->iv == persisted.iv);
        assert(chunk->plaintext_hash == persisted.plaintext_hash);

        const auto plaintext = swarmshare::crypto::EncryptionService::decrypt_chunk(key, *chunk);
        assert(plaintext.has_value());
        assert(*plaintext == swarmshare::ChunkData(1024, 0x7A));

        assert(reloaded.remove_file(file_id) == 2);
    }

    {
        ChunkStore wiped(config);
        assert(wiped.load_persisted(file_id) == 0);
    }

    std::filesystem::remove_all(config.storage_directory);
    return 0;
}
