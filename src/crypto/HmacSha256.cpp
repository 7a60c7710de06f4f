#include "swarmshare/crypto/HmacSha256.hpp"

#include <algorithm>

namespace swarmshare::crypto {

namespace {
constexpr std::size_t kMinimumTagSize = 16;
}

HmacSha256::HmacSha256(std::span<const std::uint8_t> key) {
    std::array<std::uint8_t, Sha256::kBlockSize> block{};
    if (key.size() > block.size()) {
        const auto hashed = Sha256::digest(key);
        std::copy(hashed.begin(), hashed.end(), block.begin());
    } else {
        std::copy(key.begin(), key.end(), block.begin());
    }

    std::array<std::uint8_t, Sha256::kBlockSize> inner_pad{};
    for (std::size_t i = 0; i < block.size(); ++i) {
        inner_pad[i] = static_cast<std::uint8_t>(block[i] ^ 0x36u);
        outer_pad_[i] = static_cast<std::uint8_t>(block[i] ^ 0x5cu);
    }
    inner_.update(inner_pad);
    block.fill(0);
}

void HmacSha256::update(std::span<const std::uint8_t> data) {
    inner_.update(data);
}

Digest HmacSha256::finalize() {
    const auto inner_digest = inner_.finalize();
    Sha256 outer;
    outer.update(outer_pad_);
    outer.update(inner_digest);
    return outer.finalize();
}

Digest HmacSha256::compute(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
    HmacSha256 mac(key);
    mac.update(data);
    return mac.finalize();
}

bool HmacSha256::verify(std::span<const std::uint8_t> key,
                        std::span<const std::uint8_t> data,
                        std::span<const std::uint8_t> mac) {
    if (mac.size() < kMinimumTagSize || mac.size() > kDigestSize) {
        return false;
    }
    const auto expected = compute(key, data);
    return constant_time_equal(std::span<const std::uint8_t>(expected.data(), mac.size()), mac);
}

bool constant_time_equal(std::span<const std::uint8_t> lhs, std::span<const std::uint8_t> rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    std::uint8_t diff = 0;
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        diff |= static_cast<std::uint8_t>(lhs[i] ^ rhs[i]);
    }
    return diff == 0;
}

}  // namespace swarmshare::crypto
