#include "swarmshare/protocol/PeerMessage.hpp"

#include "swarmshare/protocol/Wire.hpp"

#include <type_traits>
#include <utility>

namespace swarmshare::protocol {

std::vector<std::uint8_t> encode_peer_message(const PeerMessage& message) {
    std::vector<std::uint8_t> out{};
    WireWriter writer(out);
    std::visit(
        [&](const auto& body) {
            using MessageType = std::decay_t<decltype(body)>;

            if constexpr (std::is_same_v<MessageType, ChunkRequest>) {
                writer.u8(static_cast<std::uint8_t>(PeerMessageType::ChunkRequest));
                writer.string(body.file_id);
                writer.u32(body.chunk_index);
            } else if constexpr (std::is_same_v<MessageType, ChunkResponse>) {
                const auto& chunk = body.chunk;
                out.reserve(64 + chunk.file_id.size() + chunk.ciphertext.size());
                writer.u8(static_cast<std::uint8_t>(PeerMessageType::ChunkResponse));
                writer.string(chunk.file_id);
                writer.u32(chunk.chunk_index);
                writer.raw(chunk.iv);
                writer.raw(chunk.plaintext_hash);
                writer.blob(chunk.ciphertext);
            } else if constexpr (std::is_same_v<MessageType, ChunkReject>) {
                writer.u8(static_cast<std::uint8_t>(PeerMessageType::ChunkReject));
                writer.string(body.file_id);
                writer.u32(body.chunk_index);
                writer.u8(static_cast<std::uint8_t>(body.reason));
            }
        },
        message);
    return out;
}

std::optional<PeerMessage> decode_peer_message(std::span<const std::uint8_t> buffer) {
    WireReader reader(buffer);
    std::uint8_t type = 0;
    if (!reader.u8(type)) {
        return std::nullopt;
    }

    switch (static_cast<PeerMessageType>(type)) {
        case PeerMessageType::ChunkRequest: {
            ChunkRequest request{};
            if (!reader.string(request.file_id) || !reader.u32(request.chunk_index) || !reader.at_end()) {
                return std::nullopt;
            }
            return request;
        }
        case PeerMessageType::ChunkResponse: {
            ChunkResponse response{};
            auto& chunk = response.chunk;
            if (!reader.string(chunk.file_id) || !reader.u32(chunk.chunk_index) || !reader.raw(chunk.iv) ||
                !reader.raw(chunk.plaintext_hash) || !reader.blob(chunk.ciphertext) || !reader.at_end()) {
                return std::nullopt;
            }
            return response;
        }
        case PeerMessageType::ChunkReject: {
            ChunkReject reject{};
            std::uint8_t reason = 0;
            if (!reader.string(reject.file_id) || !reader.u32(reject.chunk_index) || !reader.u8(reason) ||
                !reader.at_end()) {
                return std::nullopt;
            }
            if (reason > static_cast<std::uint8_t>(ErrorCode::AlreadyActive)) {
                return std::nullopt;
            }
            reject.reason = static_cast<ErrorCode>(reason);
            return reject;
        }
    }
    return std::nullopt;
}

}  // namespace swarmshare::protocol
