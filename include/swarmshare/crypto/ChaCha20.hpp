#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace swarmshare::crypto {

struct Key {
    std::array<std::uint8_t, 32> bytes{};
};

struct Nonce {
    std::array<std::uint8_t, 12> bytes{};
};

// RFC 8439 stream cipher. The keystream position carries across process() calls.
class ChaCha20 {
public:
    ChaCha20(const Key& key, const Nonce& nonce, std::uint32_t counter = 0);
    ~ChaCha20();

    ChaCha20(const ChaCha20&) = delete;
    ChaCha20& operator=(const ChaCha20&) = delete;

    // input and output may alias.
    void process(std::span<const std::uint8_t> input, std::span<std::uint8_t> output);

    static std::vector<std::uint8_t> apply(const Key& key,
                                           const Nonce& nonce,
                                           std::span<const std::uint8_t> input,
                                           std::uint32_t counter = 0);

private:
    static constexpr std::size_t kBlockSize = 64;

    void refill();

    std::array<std::uint32_t, 16> state_{};
    std::array<std::uint8_t, kBlockSize> keystream_{};
    std::size_t keystream_offset_{kBlockSize};
};

}  // namespace swarmshare::crypto
