#include "swarmshare/Types.hpp"

#include <algorithm>
#include <cctype>
#include <functional>

namespace swarmshare {

namespace {
constexpr char kHexDigits[] = "0123456789abcdef";
constexpr std::size_t kMaxFileIdLength = 128;

int hex_value(char ch) noexcept {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

}  // namespace

std::size_t DeviceKeyHash::operator()(const DeviceKey& key) const noexcept {
    const auto principal_hash = std::hash<std::string>{}(key.principal);
    const auto device_hash = std::hash<std::string>{}(key.device);
    return principal_hash ^ (device_hash + 0x9e3779b97f4a7c15ull + (principal_hash << 6) + (principal_hash >> 2));
}

std::string device_key_to_string(const DeviceKey& key) {
    return key.principal + "/" + key.device;
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::string text;
    text.reserve(bytes.size() * 2);
    for (const auto byte : bytes) {
        text.push_back(kHexDigits[(byte >> 4) & 0x0Fu]);
        text.push_back(kHexDigits[byte & 0x0Fu]);
    }
    return text;
}

std::optional<std::vector<std::uint8_t>> from_hex(std::string_view text) {
    if (text.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(text.size() / 2);
    for (std::size_t offset = 0; offset < text.size(); offset += 2) {
        const auto high = hex_value(text[offset]);
        const auto low = hex_value(text[offset + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    return bytes;
}

std::string digest_to_string(const Digest& digest) {
    return to_hex(digest);
}

std::optional<Digest> digest_from_string(std::string_view text) {
    if (text.size() != Digest{}.size() * 2) {
        return std::nullopt;
    }
    const auto bytes = from_hex(text);
    if (!bytes.has_value()) {
        return std::nullopt;
    }
    Digest digest{};
    std::copy(bytes->begin(), bytes->end(), digest.begin());
    return digest;
}

bool is_valid_file_id(std::string_view file_id) noexcept {
    if (file_id.empty() || file_id.size() > kMaxFileIdLength) {
        return false;
    }
    return std::all_of(file_id.begin(), file_id.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0 || ch == '.' || ch == '_' || ch == '-';
    });
}

std::uint32_t chunk_count_for(std::uint64_t file_size, std::uint32_t chunk_size) noexcept {
    if (chunk_size == 0) {
        return 0;
    }
    return static_cast<std::uint32_t>((file_size + chunk_size - 1) / chunk_size);
}

}  // namespace swarmshare
