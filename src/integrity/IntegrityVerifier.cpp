#include "swarmshare/integrity/IntegrityVerifier.hpp"

#include "swarmshare/crypto/HmacSha256.hpp"
#include "swarmshare/crypto/Sha256.hpp"

#include <array>
#include <fstream>

namespace swarmshare::integrity {

namespace {
constexpr std::size_t kReadBufferSize = 64 * 1024;
}

std::string IntegrityVerifier::file_checksum(std::span<const std::uint8_t> content) {
    return digest_to_string(crypto::Sha256::digest(content));
}

std::optional<std::string> IntegrityVerifier::file_checksum(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::nullopt;
    }

    crypto::Sha256 hasher;
    std::array<char, kReadBufferSize> buffer{};
    while (stream) {
        stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto read = stream.gcount();
        if (read > 0) {
            hasher.update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(buffer.data()),
                                                        static_cast<std::size_t>(read)));
        }
    }
    if (stream.bad()) {
        return std::nullopt;
    }
    return digest_to_string(hasher.finalize());
}

Digest IntegrityVerifier::chunk_hash(std::span<const std::uint8_t> plaintext) {
    return crypto::Sha256::digest(plaintext);
}

bool IntegrityVerifier::verify_chunk(std::span<const std::uint8_t> plaintext, const Digest& expected) {
    const auto actual = chunk_hash(plaintext);
    return crypto::constant_time_equal(actual, expected);
}

bool IntegrityVerifier::is_valid_checksum(std::string_view checksum) noexcept {
    return checksum.size() == 64 && digest_from_string(checksum).has_value();
}

bool IntegrityVerifier::checksums_equal(std::string_view lhs, std::string_view rhs) noexcept {
    const auto left = digest_from_string(lhs);
    const auto right = digest_from_string(rhs);
    if (!left.has_value() || !right.has_value()) {
        return false;
    }
    return *left == *right;
}

Status IntegrityVerifier::check_trust(std::string_view sender_checksum, std::string_view coordinator_checksum) {
    if (!checksums_equal(sender_checksum, coordinator_checksum)) {
        return make_error(ErrorCode::ChecksumMismatch, "sender and coordinator checksums differ");
    }
    return make_ok();
}

Status IntegrityVerifier::verify_assembled(std::string_view computed,
                                           std::string_view sender_checksum,
                                           std::string_view coordinator_checksum) {
    if (!checksums_equal(computed, coordinator_checksum)) {
        return make_error(ErrorCode::IntegrityFailure, "assembled file does not match coordinator checksum");
    }
    if (!checksums_equal(computed, sender_checksum)) {
        return make_error(ErrorCode::IntegrityFailure, "assembled file does not match sender checksum");
    }
    return make_ok();
}

}  // namespace swarmshare::integrity
