#pragma once

#include "swarmshare/Error.hpp"
#include "swarmshare/Types.hpp"
#include "swarmshare/crypto/EncryptionService.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace swarmshare {

// Everything a recipient needs to fetch a file. Travels only through the end-to-end encrypted
// messaging layer; the coordinator never sees it.
struct FileNotification {
    FileId file_id;
    std::string file_name;
    std::string mime_type;
    std::uint64_t file_size{0};
    std::uint32_t chunk_count{0};
    std::string checksum;
    crypto::FileKey file_key{};
    PrincipalId sender_id;
    std::chrono::system_clock::time_point timestamp{};
};

// `key=value` lines; newlines and backslashes in values are escaped.
std::string serialize_notification(const FileNotification& notification);
Result<FileNotification> parse_notification(std::string_view text);

}  // namespace swarmshare
