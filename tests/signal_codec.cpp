#include "swarmshare/protocol/PeerMessage.hpp"
#include "swarmshare/protocol/Signal.hpp"

#include <cassert>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace {

void signal_messages() {
    using namespace swarmshare::protocol;

    SignalMessage announce{};
    announce.type = SignalType::Announce;
    announce.request_id = 42;
    AnnouncePayload body{};
    body.request.file_id = "c0ffee00c0ffee00c0ffee00c0ffee00";
    body.request.file_size = 1048576;
    body.request.checksum = std::string(64, 'd');
    body.request.chunk_count = 16;
    body.request.available_chunks = {0, 1, 15};
    body.request.shared_with = {"bob", "carol"};
    body.request.upload_slots = 6;
    announce.payload = body;

    const auto decoded = decode(encode(announce));
    assert(decoded.has_value());
    assert(decoded->type == SignalType::Announce);
    assert(decoded->request_id == 42);
    const auto* request = std::get_if<AnnouncePayload>(&decoded->payload);
    assert(request != nullptr);
    assert(request->request.file_id == body.request.file_id);
    assert(request->request.available_chunks == body.request.available_chunks);
    assert(request->request.shared_with == body.request.shared_with);
    assert(request->request.upload_slots == 6);

    // A response carrying a FileInfo body.
    SignalMessage response = make_response(42, swarmshare::make_ok());
    auto& payload = std::get<ResponsePayload>(response.payload);
    payload.body = ResponseBody::File;
    payload.info.file_id = body.request.file_id;
    payload.info.chunk_count = 16;
    payload.info.chunk_quality = 100;
    payload.info.creator = "alice";
    payload.info.seeders.push_back(swarmshare::SeederInfo{{"alice", "laptop"}, {0, 1, 2}, 4, 1});
    const auto decoded_response = decode(encode(response));
    assert(decoded_response.has_value());
    const auto& info = std::get<ResponsePayload>(decoded_response->payload).info;
    assert(info.chunk_quality == 100);
    assert(info.seeders.size() == 1);
    assert(info.seeders.front().device.device == "laptop");
    assert(info.seeders.front().active_uploads == 1);

    const auto denied = decode(encode(make_response(7, swarmshare::make_error(swarmshare::ErrorCode::AccessDenied, "access denied"))));
    assert(denied.has_value());
    assert(std::get<ResponsePayload>(denied->payload).code == swarmshare::ErrorCode::AccessDenied);

    // Unknown version, unknown type, trailing bytes and a payload for another type are rejected.
    auto bytes = encode(announce);
    auto bad_version = bytes;
    bad_version[0] = kSignalVersion + 1;
    assert(!decode(bad_version).has_value());
    auto bad_type = bytes;
    bad_type[1] = 0x7F;
    assert(!decode(bad_type).has_value());
    auto trailing = bytes;
    trailing.push_back(0x00);
    assert(!decode(trailing).has_value());
    auto mismatched = bytes;
    mismatched[1] = static_cast<std::uint8_t>(SignalType::Hello);
    assert(!decode(mismatched).has_value());
    const std::vector<std::uint8_t> truncated(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() / 2));
    assert(!decode(truncated).has_value());

    assert(push_kind_for(push_signal_type(swarmshare::PushKind::AccessRevoked)) == swarmshare::PushKind::AccessRevoked);
    assert(relay_kind_for(relay_signal_type(swarmshare::RelayKind::IceCandidate)) == swarmshare::RelayKind::IceCandidate);
    assert(!push_kind_for(SignalType::Offer).has_value());
}

void frame_assembly() {
    using namespace swarmshare::protocol;

    SignalMessage push{};
    push.type = SignalType::SeedersUpdate;
    push.payload = NotifyPayload{"c0ffee00c0ffee00c0ffee00c0ffee00", 3, 75, {0, 1, 2}};

    SignalMessage relay{};
    relay.type = SignalType::Offer;
    relay.payload = RelayPayload{"c0ffee00c0ffee00c0ffee00c0ffee00", {"alice", "laptop"}, {"bob", ""}, "opaque-sdp"};

    auto stream = encode_frame(push);
    const auto second = encode_frame(relay);
    stream.insert(stream.end(), second.begin(), second.end());

    // Delivered a byte at a time, both frames still come out whole and in order.
    FrameAssembler assembler;
    std::vector<std::vector<std::uint8_t>> frames;
    for (const auto byte : stream) {
        assembler.append(std::span<const std::uint8_t>(&byte, 1));
        while (auto frame = assembler.next()) {
            frames.push_back(std::move(*frame));
        }
    }
    assert(frames.size() == 2);
    const auto first = decode(frames[0]);
    assert(first.has_value());
    assert(first->type == SignalType::SeedersUpdate);
    assert(std::get<NotifyPayload>(first->payload).chunk_quality == 75);
    const auto offer = decode(frames[1]);
    assert(offer.has_value());
    assert(std::get<RelayPayload>(offer->payload).to.device.empty());
    assert(std::get<RelayPayload>(offer->payload).payload == "opaque-sdp");

    FrameAssembler bounded(16);
    const std::vector<std::uint8_t> oversized{0x00, 0x00, 0x01, 0x00};
    bounded.append(oversized);
    assert(!bounded.next().has_value());
    assert(bounded.overflowed());
}

void peer_messages() {
    using namespace swarmshare::protocol;

    const auto key = swarmshare::crypto::EncryptionService::generate_key();
    const swarmshare::ChunkData plaintext(300, 0x5C);
    const auto chunk = swarmshare::crypto::EncryptionService::encrypt_chunk(key, "c0ffee00c0ffee00c0ffee00c0ffee00", 9, plaintext);

    const auto response = decode_peer_message(encode_peer_message(ChunkResponse{chunk}));
    assert(response.has_value());
    const auto* body = std::get_if<ChunkResponse>(&*response);
    assert(body != nullptr);
    assert(body->chunk.chunk_index == 9);
    assert(body->chunk.iv == chunk.iv);
    assert(body->chunk.plaintext_hash == chunk.plaintext_hash);
    assert(swarmshare::crypto::EncryptionService::decrypt_chunk(key, body->chunk) == plaintext);

    const auto reject = decode_peer_message(
        encode_peer_message(ChunkReject{"c0ffee00c0ffee00c0ffee00c0ffee00", 4, swarmshare::ErrorCode::RateLimited}));
    assert(reject.has_value());
    assert(std::get<ChunkReject>(*reject).reason == swarmshare::ErrorCode::RateLimited);

    auto request = encode_peer_message(ChunkRequest{"c0ffee00c0ffee00c0ffee00c0ffee00", 2});
    assert(decode_peer_message(request).has_value());
    request.push_back(0x01);
    assert(!decode_peer_message(request).has_value());
    assert(!decode_peer_message(std::vector<std::uint8_t>{0x7E}).has_value());
}

}  // namespace

int main() {
    signal_messages();
    frame_assembly();
    peer_messages();
    return 0;
}
