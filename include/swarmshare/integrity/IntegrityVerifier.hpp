#pragma once

#include "swarmshare/Error.hpp"
#include "swarmshare/Types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace swarmshare::integrity {

// Canonical checksums are lower-case hex SHA-256 of the whole plaintext file.
class IntegrityVerifier {
public:
    static std::string file_checksum(std::span<const std::uint8_t> content);
    // Streams the file; nullopt when it cannot be read.
    static std::optional<std::string> file_checksum(const std::filesystem::path& path);

    static Digest chunk_hash(std::span<const std::uint8_t> plaintext);
    static bool verify_chunk(std::span<const std::uint8_t> plaintext, const Digest& expected);

    static bool is_valid_checksum(std::string_view checksum) noexcept;
    // Case-insensitive; malformed values never match.
    static bool checksums_equal(std::string_view lhs, std::string_view rhs) noexcept;

    // Before any bytes are fetched: the checksum the sender put in the notification must match the
    // one the coordinator holds. CHECKSUM_MISMATCH otherwise.
    static Status check_trust(std::string_view sender_checksum, std::string_view coordinator_checksum);

    // After assembly: computed, sender and coordinator values must all agree. INTEGRITY_FAILURE otherwise.
    static Status verify_assembled(std::string_view computed,
                                   std::string_view sender_checksum,
                                   std::string_view coordinator_checksum);
};

}  // namespace swarmshare::integrity
