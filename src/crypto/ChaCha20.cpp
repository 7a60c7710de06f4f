#include "swarmshare/crypto/ChaCha20.hpp"

#include <algorithm>
#include <bit>

namespace swarmshare::crypto {

namespace {

inline std::uint32_t load_le(const std::uint8_t* p) noexcept {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

inline void mix(std::array<std::uint32_t, 16>& x, int a, int b, int c, int d) noexcept {
    x[a] += x[b];
    x[d] = std::rotl(x[d] ^ x[a], 16);
    x[c] += x[d];
    x[b] = std::rotl(x[b] ^ x[c], 12);
    x[a] += x[b];
    x[d] = std::rotl(x[d] ^ x[a], 8);
    x[c] += x[d];
    x[b] = std::rotl(x[b] ^ x[c], 7);
}

}  // namespace

ChaCha20::ChaCha20(const Key& key, const Nonce& nonce, std::uint32_t counter) {
    // "expand 32-byte k"
    state_[0] = 0x61707865u;
    state_[1] = 0x3320646eu;
    state_[2] = 0x79622d32u;
    state_[3] = 0x6b206574u;
    for (std::size_t i = 0; i < 8; ++i) {
        state_[4 + i] = load_le(key.bytes.data() + i * 4);
    }
    state_[12] = counter;
    for (std::size_t i = 0; i < 3; ++i) {
        state_[13 + i] = load_le(nonce.bytes.data() + i * 4);
    }
}

ChaCha20::~ChaCha20() {
    state_.fill(0);
    keystream_.fill(0);
}

void ChaCha20::refill() {
    auto working = state_;
    for (int round = 0; round < 10; ++round) {
        mix(working, 0, 4, 8, 12);
        mix(working, 1, 5, 9, 13);
        mix(working, 2, 6, 10, 14);
        mix(working, 3, 7, 11, 15);
        mix(working, 0, 5, 10, 15);
        mix(working, 1, 6, 11, 12);
        mix(working, 2, 7, 8, 13);
        mix(working, 3, 4, 9, 14);
    }
    for (std::size_t i = 0; i < working.size(); ++i) {
        const auto word = working[i] + state_[i];
        keystream_[i * 4 + 0] = static_cast<std::uint8_t>(word);
        keystream_[i * 4 + 1] = static_cast<std::uint8_t>(word >> 8);
        keystream_[i * 4 + 2] = static_cast<std::uint8_t>(word >> 16);
        keystream_[i * 4 + 3] = static_cast<std::uint8_t>(word >> 24);
    }
    ++state_[12];
    keystream_offset_ = 0;
}

void ChaCha20::process(std::span<const std::uint8_t> input, std::span<std::uint8_t> output) {
    const auto length = std::min(input.size(), output.size());
    for (std::size_t i = 0; i < length; ++i) {
        if (keystream_offset_ == kBlockSize) {
            refill();
        }
        output[i] = static_cast<std::uint8_t>(input[i] ^ keystream_[keystream_offset_++]);
    }
}

std::vector<std::uint8_t> ChaCha20::apply(const Key& key,
                                          const Nonce& nonce,
                                          std::span<const std::uint8_t> input,
                                          std::uint32_t counter) {
    std::vector<std::uint8_t> output(input.size());
    ChaCha20 cipher(key, nonce, counter);
    cipher.process(input, output);
    return output;
}

}  // namespace swarmshare::crypto
