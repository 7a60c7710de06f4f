#pragma once

#include "swarmshare/crypto/Sha256.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace swarmshare::crypto {

class HmacSha256 {
public:
    static constexpr std::size_t kDigestSize = Sha256::kDigestSize;

    explicit HmacSha256(std::span<const std::uint8_t> key);

    void update(std::span<const std::uint8_t> data);
    Digest finalize();

    static Digest compute(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data);

    // Accepts truncated tags of at least 16 bytes; comparison time does not depend on content.
    static bool verify(std::span<const std::uint8_t> key,
                       std::span<const std::uint8_t> data,
                       std::span<const std::uint8_t> mac);

private:
    Sha256 inner_;
    std::array<std::uint8_t, Sha256::kBlockSize> outer_pad_{};
};

bool constant_time_equal(std::span<const std::uint8_t> lhs, std::span<const std::uint8_t> rhs) noexcept;

}  // namespace swarmshare::crypto
