#pragma once

#include "swarmshare/Error.hpp"
#include "swarmshare/Types.hpp"
#include "swarmshare/crypto/EncryptionService.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace swarmshare::protocol {

// Messages exchanged inside an established peer channel.
enum class PeerMessageType : std::uint8_t {
    ChunkRequest = 0x01,
    ChunkResponse = 0x02,
    ChunkReject = 0x03,
};

struct ChunkRequest {
    FileId file_id;
    ChunkIndex chunk_index{0};
};

struct ChunkResponse {
    crypto::EncryptedChunk chunk;
};

struct ChunkReject {
    FileId file_id;
    ChunkIndex chunk_index{0};
    ErrorCode reason{ErrorCode::Unavailable};
};

using PeerMessage = std::variant<ChunkRequest, ChunkResponse, ChunkReject>;

std::vector<std::uint8_t> encode_peer_message(const PeerMessage& message);
std::optional<PeerMessage> decode_peer_message(std::span<const std::uint8_t> buffer);

}  // namespace swarmshare::protocol
