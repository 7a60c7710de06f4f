#include "swarmshare/network/KeyExchange.hpp"

#include "swarmshare/crypto/EncryptionService.hpp"
#include "swarmshare/crypto/HmacSha256.hpp"

#include <algorithm>
#include <string_view>
#include <vector>

namespace swarmshare::network {

namespace {

constexpr std::string_view kChannelLabel = "swarmshare/channel";
constexpr std::string_view kCipherLabel = "swarmshare/channel/cipher";
constexpr std::string_view kMacLabel = "swarmshare/channel/mac";

std::span<const std::uint8_t> as_bytes(std::string_view text) {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}  // namespace

std::uint64_t KeyExchange::modexp(std::uint64_t base, std::uint64_t exponent, std::uint64_t modulus) {
    unsigned __int128 result = 1 % modulus;
    unsigned __int128 factor = base % modulus;
    while (exponent > 0) {
        if (exponent & 1u) {
            result = (result * factor) % modulus;
        }
        factor = (factor * factor) % modulus;
        exponent >>= 1u;
    }
    return static_cast<std::uint64_t>(result);
}

KeyPair KeyExchange::generate_keypair() {
    std::array<std::uint8_t, 8> random{};
    crypto::EncryptionService::random_bytes(random);
    std::uint64_t value = 0;
    for (const auto byte : random) {
        value = (value << 8) | byte;
    }
    // Private exponent in [2, p - 2].
    const auto private_key = 2 + value % (kPrime - 3);
    return KeyPair{private_key, compute_public(private_key)};
}

std::uint64_t KeyExchange::compute_public(std::uint64_t private_key) {
    return modexp(kGenerator, private_key, kPrime);
}

bool KeyExchange::validate_public(std::uint64_t candidate) {
    return candidate > 1u && candidate < kPrime - 1;
}

ChannelKeys KeyExchange::derive_channel_keys(std::uint64_t private_key,
                                             std::uint64_t remote_public,
                                             std::span<const std::uint8_t> offer_nonce,
                                             std::span<const std::uint8_t> answer_nonce) {
    const auto shared_scalar = modexp(remote_public % kPrime, private_key, kPrime);

    std::array<std::uint8_t, 8> secret{};
    for (std::size_t i = 0; i < secret.size(); ++i) {
        const auto shift = static_cast<std::uint32_t>((secret.size() - 1 - i) * 8);
        secret[i] = static_cast<std::uint8_t>((shared_scalar >> shift) & 0xFFu);
    }

    crypto::HmacSha256 extract(secret);
    extract.update(as_bytes(kChannelLabel));
    extract.update(offer_nonce);
    extract.update(answer_nonce);
    auto master = extract.finalize();

    ChannelKeys keys{};
    keys.cipher.bytes = crypto::HmacSha256::compute(master, as_bytes(kCipherLabel));
    keys.mac = crypto::HmacSha256::compute(master, as_bytes(kMacLabel));
    std::fill(master.begin(), master.end(), std::uint8_t{0});
    std::fill(secret.begin(), secret.end(), std::uint8_t{0});
    return keys;
}

}  // namespace swarmshare::network
