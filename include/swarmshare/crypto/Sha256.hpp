#pragma once

#include "swarmshare/Types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace swarmshare::crypto {

// Streaming SHA-256 (FIPS 180-4). finalize() leaves the object reset for reuse.
class Sha256 {
public:
    static constexpr std::size_t kBlockSize = 64;
    static constexpr std::size_t kDigestSize = 32;

    Sha256();

    void update(std::span<const std::uint8_t> data);
    Digest finalize();
    void reset();

    static Digest digest(std::span<const std::uint8_t> data);

private:
    void compress(const std::uint8_t* block);

    std::array<std::uint32_t, 8> state_{};
    std::array<std::uint8_t, kBlockSize> pending_{};
    std::size_t pending_size_{0};
    std::uint64_t total_bytes_{0};
};

}  // namespace swarmshare::crypto
