#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace swarmshare {

using FileId = std::string;
using PrincipalId = std::string;
using DeviceId = std::string;
using ChunkIndex = std::uint32_t;
using ChunkData = std::vector<std::uint8_t>;
using Digest = std::array<std::uint8_t, 32>;

// A principal may be online from several devices; signaling and rosters are addressed per device.
struct DeviceKey {
    PrincipalId principal;
    DeviceId device;

    auto operator<=>(const DeviceKey&) const = default;
};

struct DeviceKeyHash {
    std::size_t operator()(const DeviceKey& key) const noexcept;
};

enum class TransferRole : std::uint8_t {
    Upload,
    Download
};

std::string device_key_to_string(const DeviceKey& key);

std::string to_hex(std::span<const std::uint8_t> bytes);
std::optional<std::vector<std::uint8_t>> from_hex(std::string_view text);

std::string digest_to_string(const Digest& digest);
std::optional<Digest> digest_from_string(std::string_view text);

bool is_valid_file_id(std::string_view file_id) noexcept;
std::uint32_t chunk_count_for(std::uint64_t file_size, std::uint32_t chunk_size) noexcept;

}  // namespace swarmshare
