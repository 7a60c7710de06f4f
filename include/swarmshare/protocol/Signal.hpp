#pragma once

#include "swarmshare/Error.hpp"
#include "swarmshare/SwarmTypes.hpp"
#include "swarmshare/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace swarmshare::protocol {

inline constexpr std::uint8_t kSignalVersion = 1;
inline constexpr std::size_t kMaxSignalFrameSize = 8u * 1024u * 1024u;

enum class SignalType : std::uint8_t {
    Hello = 0x01,
    Announce = 0x02,
    UpdateChunks = 0x03,
    GetInfo = 0x04,
    ListSeeders = 0x05,
    ShareUpdate = 0x06,
    Unannounce = 0x07,
    RegisterLeecher = 0x08,
    UnregisterLeecher = 0x09,
    Offer = 0x10,
    Answer = 0x11,
    IceCandidate = 0x12,
    Response = 0x20,
    FileAvailable = 0x30,
    SeedersUpdate = 0x31,
    UploaderOnline = 0x32,
    AccessRevoked = 0x33,
};

struct HelloPayload {
    DeviceKey device;
    std::string token;
};

struct AnnouncePayload {
    AnnounceRequest request;
};

// UpdateChunks and RegisterLeecher.
struct ChunkListPayload {
    FileId file_id;
    std::vector<ChunkIndex> chunks;
    std::uint16_t active_uploads{0};
};

// GetInfo, ListSeeders, Unannounce and UnregisterLeecher.
struct FileQueryPayload {
    FileId file_id;
};

struct ShareUpdatePayload {
    FileId file_id;
    ShareAction action{ShareAction::Add};
    std::vector<PrincipalId> targets;
};

// Offer, Answer and IceCandidate. The message type carries the relay kind.
struct RelayPayload {
    FileId file_id;
    DeviceKey from;
    DeviceKey to;
    std::string payload;
};

enum class ResponseBody : std::uint8_t {
    None = 0,
    File = 1,
    Seeders = 2,
    Principals = 3,
};

struct ResponsePayload {
    ErrorCode code{ErrorCode::None};
    std::string message;
    ResponseBody body{ResponseBody::None};
    FileInfo info;
    std::vector<SeederInfo> seeders;
    std::vector<PrincipalId> principals;
};

// FileAvailable, SeedersUpdate, UploaderOnline and AccessRevoked.
struct NotifyPayload {
    FileId file_id;
    std::uint32_t seeder_count{0};
    std::uint8_t chunk_quality{0};
    std::vector<ChunkIndex> available_chunks;
};

using SignalPayload = std::variant<HelloPayload,
                                   AnnouncePayload,
                                   ChunkListPayload,
                                   FileQueryPayload,
                                   ShareUpdatePayload,
                                   RelayPayload,
                                   ResponsePayload,
                                   NotifyPayload>;

struct SignalMessage {
    std::uint8_t version{kSignalVersion};
    SignalType type{SignalType::Hello};
    // Echoed by the response; zero for pushes and relays.
    std::uint32_t request_id{0};
    SignalPayload payload{};
};

// Encoded body: version, type, request id, payload. No length prefix.
std::vector<std::uint8_t> encode(const SignalMessage& message);
// Rejects unknown versions and types, a payload that does not fit the type, and trailing bytes.
std::optional<SignalMessage> decode(std::span<const std::uint8_t> buffer);

// encode() behind a u32 length prefix.
std::vector<std::uint8_t> encode_frame(const SignalMessage& message);

// Splits a byte stream into length-prefixed frames.
class FrameAssembler {
public:
    explicit FrameAssembler(std::size_t max_frame_size = kMaxSignalFrameSize);

    void append(std::span<const std::uint8_t> bytes);
    // Next complete frame body, if one is buffered.
    std::optional<std::vector<std::uint8_t>> next();
    // Set once a frame header announced more than the maximum; the stream is unusable afterwards.
    [[nodiscard]] bool overflowed() const noexcept { return overflowed_; }

private:
    std::size_t max_frame_size_;
    std::vector<std::uint8_t> buffer_;
    bool overflowed_{false};
};

SignalType push_signal_type(PushKind kind) noexcept;
std::optional<PushKind> push_kind_for(SignalType type) noexcept;
SignalType relay_signal_type(RelayKind kind) noexcept;
std::optional<RelayKind> relay_kind_for(SignalType type) noexcept;

SignalMessage make_response(std::uint32_t request_id, const Status& status);
PushNotification to_push(PushKind kind, const NotifyPayload& payload);
NotifyPayload to_notify(const PushNotification& push);

}  // namespace swarmshare::protocol
