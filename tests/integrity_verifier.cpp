#include "swarmshare/crypto/EncryptionService.hpp"
#include "swarmshare/integrity/IntegrityVerifier.hpp"

#include <algorithm>
#include <cassert>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

int main() {
    using swarmshare::ErrorCode;
    using swarmshare::integrity::IntegrityVerifier;
    using swarmshare::crypto::EncryptionService;

    const std::string abc = "abc";
    const auto abc_checksum = IntegrityVerifier::file_checksum(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(abc.data()), abc.size()));
    assert(abc_checksum == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(IntegrityVerifier::is_valid_checksum(abc_checksum));
    assert(!IntegrityVerifier::is_valid_checksum("ba7816bf"));
    assert(!IntegrityVerifier::is_valid_checksum(std::string(64, 'z')));

    auto upper = abc_checksum;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    assert(IntegrityVerifier::checksums_equal(abc_checksum, upper));
    assert(!IntegrityVerifier::checksums_equal(abc_checksum, "garbage"));

    // Streaming over a file agrees with the in-memory digest, across buffer boundaries.
    std::vector<std::uint8_t> content(200 * 1024 + 17);
    for (std::size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<std::uint8_t>(i % 251u);
    }
    const auto path = std::filesystem::temp_directory_path() / "swarmshare_integrity_test.bin";
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    }
    const auto streamed = IntegrityVerifier::file_checksum(path);
    assert(streamed.has_value());
    assert(*streamed == IntegrityVerifier::file_checksum(content));
    std::filesystem::remove(path);
    assert(!IntegrityVerifier::file_checksum(path).has_value());

    const auto canonical = IntegrityVerifier::file_checksum(content);
    const auto other = abc_checksum;

    assert(IntegrityVerifier::check_trust(canonical, canonical).ok());
    assert(IntegrityVerifier::check_trust(abc_checksum, upper).ok());
    const auto distrust = IntegrityVerifier::check_trust(canonical, other);
    assert(distrust.code == ErrorCode::ChecksumMismatch);

    assert(IntegrityVerifier::verify_assembled(canonical, canonical, canonical).ok());
    assert(IntegrityVerifier::verify_assembled(other, canonical, canonical).code == ErrorCode::IntegrityFailure);
    assert(IntegrityVerifier::verify_assembled(canonical, other, canonical).code == ErrorCode::IntegrityFailure);
    assert(IntegrityVerifier::verify_assembled(canonical, canonical, other).code == ErrorCode::IntegrityFailure);

    // A single flipped bit anywhere in a chunk fails its hash check.
    const std::vector<std::uint8_t> chunk(content.begin(), content.begin() + 4096);
    const auto hash = IntegrityVerifier::chunk_hash(chunk);
    assert(IntegrityVerifier::verify_chunk(chunk, hash));
    for (const std::size_t position : {std::size_t{0}, std::size_t{2048}, std::size_t{4095}}) {
        auto corrupted = chunk;
        corrupted[position] ^= 0x01u;
        assert(!IntegrityVerifier::verify_chunk(corrupted, hash));
    }

    // Reassembling decrypted chunks in index order reproduces the canonical checksum.
    const auto key = EncryptionService::generate_key();
    const swarmshare::FileId file_id = "a1b2c3d4e5f60718293a4b5c6d7e8f90";
    constexpr std::size_t chunk_size = 64 * 1024;
    std::vector<swarmshare::crypto::EncryptedChunk> encrypted;
    for (std::size_t offset = 0, index = 0; offset < content.size(); offset += chunk_size, ++index) {
        const auto length = std::min(chunk_size, content.size() - offset);
        encrypted.push_back(EncryptionService::encrypt_chunk(
            key, file_id, static_cast<swarmshare::ChunkIndex>(index),
            std::span<const std::uint8_t>(content.data() + offset, length)));
    }
    assert(encrypted.size() == 4);

    std::vector<std::uint8_t> assembled;
    for (const auto& chunk_entry : encrypted) {
        const auto plain = EncryptionService::decrypt_chunk(key, chunk_entry);
        assert(plain.has_value());
        assert(IntegrityVerifier::verify_chunk(*plain, chunk_entry.plaintext_hash));
        assembled.insert(assembled.end(), plain->begin(), plain->end());
    }
    assert(IntegrityVerifier::verify_assembled(IntegrityVerifier::file_checksum(assembled), canonical, canonical).ok());

    return 0;
}
