#pragma once

#include "swarmshare/crypto/ChaCha20.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace swarmshare::network {

struct KeyPair {
    std::uint64_t private_key{0};
    std::uint64_t public_key{0};
};

// Keys protecting one peer channel: ChaCha20 for the body, HMAC-SHA256 for the frame tag.
struct ChannelKeys {
    crypto::Key cipher{};
    std::array<std::uint8_t, 32> mac{};
};

inline constexpr std::size_t kHandshakeNonceSize = 16;
using HandshakeNonce = std::array<std::uint8_t, kHandshakeNonceSize>;

// Finite-field Diffie-Hellman over the Mersenne prime 2^61 - 1.
class KeyExchange {
public:
    static constexpr std::uint64_t kPrime = 2305843009213693951ull;
    static constexpr std::uint64_t kGenerator = 3ull;

    static KeyPair generate_keypair();
    static std::uint64_t compute_public(std::uint64_t private_key);
    static bool validate_public(std::uint64_t candidate);

    // Both sides arrive at the same keys given the same pair of nonces.
    static ChannelKeys derive_channel_keys(std::uint64_t private_key,
                                           std::uint64_t remote_public,
                                           std::span<const std::uint8_t> offer_nonce,
                                           std::span<const std::uint8_t> answer_nonce);

private:
    static std::uint64_t modexp(std::uint64_t base, std::uint64_t exponent, std::uint64_t modulus);
};

}  // namespace swarmshare::network
