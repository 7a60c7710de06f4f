#include "swarmshare/protocol/Signal.hpp"

#include "swarmshare/protocol/Wire.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace swarmshare::protocol {

namespace {

constexpr std::size_t kHeaderSize = 1 + 1 + 4;
constexpr std::size_t kLengthPrefixSize = 4;

bool is_known_type(std::uint8_t raw) {
    switch (static_cast<SignalType>(raw)) {
        case SignalType::Hello:
        case SignalType::Announce:
        case SignalType::UpdateChunks:
        case SignalType::GetInfo:
        case SignalType::ListSeeders:
        case SignalType::ShareUpdate:
        case SignalType::Unannounce:
        case SignalType::RegisterLeecher:
        case SignalType::UnregisterLeecher:
        case SignalType::Offer:
        case SignalType::Answer:
        case SignalType::IceCandidate:
        case SignalType::Response:
        case SignalType::FileAvailable:
        case SignalType::SeedersUpdate:
        case SignalType::UploaderOnline:
        case SignalType::AccessRevoked:
            return true;
    }
    return false;
}

void write_device(WireWriter& writer, const DeviceKey& device) {
    writer.string(device.principal);
    writer.string(device.device);
}

bool read_device(WireReader& reader, DeviceKey& device) {
    return reader.string(device.principal) && reader.string(device.device);
}

void write_seeder(WireWriter& writer, const SeederInfo& seeder) {
    write_device(writer, seeder.device);
    writer.u32_list(seeder.chunks);
    writer.u16(seeder.upload_slots);
    writer.u16(seeder.active_uploads);
}

bool read_seeder(WireReader& reader, SeederInfo& seeder) {
    return read_device(reader, seeder.device) && reader.u32_list(seeder.chunks) && reader.u16(seeder.upload_slots) &&
           reader.u16(seeder.active_uploads);
}

void write_seeders(WireWriter& writer, const std::vector<SeederInfo>& seeders) {
    writer.u32(static_cast<std::uint32_t>(seeders.size()));
    for (const auto& seeder : seeders) {
        write_seeder(writer, seeder);
    }
}

bool read_seeders(WireReader& reader, std::vector<SeederInfo>& seeders) {
    std::uint32_t count = 0;
    if (!reader.u32(count) || reader.remaining() / 8 < count) {
        return false;
    }
    seeders.clear();
    seeders.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        SeederInfo seeder{};
        if (!read_seeder(reader, seeder)) {
            return false;
        }
        seeders.push_back(std::move(seeder));
    }
    return true;
}

void write_file_info(WireWriter& writer, const FileInfo& info) {
    writer.string(info.file_id);
    writer.u64(info.file_size);
    writer.u32(info.chunk_count);
    writer.u32(info.chunk_size);
    writer.string(info.checksum);
    writer.string(info.creator);
    writer.string_list(info.shared_with);
    writer.u8(info.chunk_quality);
    writer.u32_list(info.missing_chunks);
    write_seeders(writer, info.seeders);
    writer.u32(info.leecher_count);
}

bool read_file_info(WireReader& reader, FileInfo& info) {
    return reader.string(info.file_id) && reader.u64(info.file_size) && reader.u32(info.chunk_count) &&
           reader.u32(info.chunk_size) && reader.string(info.checksum) && reader.string(info.creator) &&
           reader.string_list(info.shared_with) && reader.u8(info.chunk_quality) &&
           reader.u32_list(info.missing_chunks) && read_seeders(reader, info.seeders) && reader.u32(info.leecher_count);
}

void encode_payload(WireWriter& writer, const SignalPayload& payload) {
    std::visit(
        [&](const auto& body) {
            using PayloadType = std::decay_t<decltype(body)>;

            if constexpr (std::is_same_v<PayloadType, HelloPayload>) {
                write_device(writer, body.device);
                writer.string(body.token);
            } else if constexpr (std::is_same_v<PayloadType, AnnouncePayload>) {
                const auto& request = body.request;
                writer.string(request.file_id);
                writer.u64(request.file_size);
                writer.string(request.checksum);
                writer.u32(request.chunk_count);
                writer.u32_list(request.available_chunks);
                writer.string_list(request.shared_with);
                writer.u16(request.upload_slots);
            } else if constexpr (std::is_same_v<PayloadType, ChunkListPayload>) {
                writer.string(body.file_id);
                writer.u32_list(body.chunks);
                writer.u16(body.active_uploads);
            } else if constexpr (std::is_same_v<PayloadType, FileQueryPayload>) {
                writer.string(body.file_id);
            } else if constexpr (std::is_same_v<PayloadType, ShareUpdatePayload>) {
                writer.string(body.file_id);
                writer.u8(static_cast<std::uint8_t>(body.action));
                writer.string_list(body.targets);
            } else if constexpr (std::is_same_v<PayloadType, RelayPayload>) {
                writer.string(body.file_id);
                write_device(writer, body.from);
                write_device(writer, body.to);
                writer.string(body.payload);
            } else if constexpr (std::is_same_v<PayloadType, ResponsePayload>) {
                writer.u8(static_cast<std::uint8_t>(body.code));
                writer.string(body.message);
                writer.u8(static_cast<std::uint8_t>(body.body));
                switch (body.body) {
                    case ResponseBody::File:
                        write_file_info(writer, body.info);
                        break;
                    case ResponseBody::Seeders:
                        write_seeders(writer, body.seeders);
                        break;
                    case ResponseBody::Principals:
                        writer.string_list(body.principals);
                        break;
                    case ResponseBody::None:
                        break;
                }
            } else if constexpr (std::is_same_v<PayloadType, NotifyPayload>) {
                writer.string(body.file_id);
                writer.u32(body.seeder_count);
                writer.u8(body.chunk_quality);
                writer.u32_list(body.available_chunks);
            }
        },
        payload);
}

std::optional<SignalPayload> decode_payload(SignalType type, WireReader& reader) {
    switch (type) {
        case SignalType::Hello: {
            HelloPayload body{};
            if (!read_device(reader, body.device) || !reader.string(body.token)) {
                return std::nullopt;
            }
            return body;
        }
        case SignalType::Announce: {
            AnnouncePayload body{};
            auto& request = body.request;
            if (!reader.string(request.file_id) || !reader.u64(request.file_size) || !reader.string(request.checksum) ||
                !reader.u32(request.chunk_count) || !reader.u32_list(request.available_chunks) ||
                !reader.string_list(request.shared_with) || !reader.u16(request.upload_slots)) {
                return std::nullopt;
            }
            return body;
        }
        case SignalType::UpdateChunks:
        case SignalType::RegisterLeecher: {
            ChunkListPayload body{};
            if (!reader.string(body.file_id) || !reader.u32_list(body.chunks) || !reader.u16(body.active_uploads)) {
                return std::nullopt;
            }
            return body;
        }
        case SignalType::GetInfo:
        case SignalType::ListSeeders:
        case SignalType::Unannounce:
        case SignalType::UnregisterLeecher: {
            FileQueryPayload body{};
            if (!reader.string(body.file_id)) {
                return std::nullopt;
            }
            return body;
        }
        case SignalType::ShareUpdate: {
            ShareUpdatePayload body{};
            std::uint8_t action = 0;
            if (!reader.string(body.file_id) || !reader.u8(action) || !reader.string_list(body.targets)) {
                return std::nullopt;
            }
            if (action > static_cast<std::uint8_t>(ShareAction::Revoke)) {
                return std::nullopt;
            }
            body.action = static_cast<ShareAction>(action);
            return body;
        }
        case SignalType::Offer:
        case SignalType::Answer:
        case SignalType::IceCandidate: {
            RelayPayload body{};
            if (!reader.string(body.file_id) || !read_device(reader, body.from) || !read_device(reader, body.to) ||
                !reader.string(body.payload)) {
                return std::nullopt;
            }
            return body;
        }
        case SignalType::Response: {
            ResponsePayload body{};
            std::uint8_t code = 0;
            std::uint8_t kind = 0;
            if (!reader.u8(code) || !reader.string(body.message) || !reader.u8(kind)) {
                return std::nullopt;
            }
            if (code > static_cast<std::uint8_t>(ErrorCode::AlreadyActive) ||
                kind > static_cast<std::uint8_t>(ResponseBody::Principals)) {
                return std::nullopt;
            }
            body.code = static_cast<ErrorCode>(code);
            body.body = static_cast<ResponseBody>(kind);
            bool ok = true;
            switch (body.body) {
                case ResponseBody::File:
                    ok = read_file_info(reader, body.info);
                    break;
                case ResponseBody::Seeders:
                    ok = read_seeders(reader, body.seeders);
                    break;
                case ResponseBody::Principals:
                    ok = reader.string_list(body.principals);
                    break;
                case ResponseBody::None:
                    break;
            }
            if (!ok) {
                return std::nullopt;
            }
            return body;
        }
        case SignalType::FileAvailable:
        case SignalType::SeedersUpdate:
        case SignalType::UploaderOnline:
        case SignalType::AccessRevoked: {
            NotifyPayload body{};
            if (!reader.string(body.file_id) || !reader.u32(body.seeder_count) || !reader.u8(body.chunk_quality) ||
                !reader.u32_list(body.available_chunks)) {
                return std::nullopt;
            }
            return body;
        }
    }
    return std::nullopt;
}

}  // namespace

std::vector<std::uint8_t> encode(const SignalMessage& message) {
    std::vector<std::uint8_t> out{};
    out.reserve(128);
    WireWriter writer(out);
    writer.u8(kSignalVersion);
    writer.u8(static_cast<std::uint8_t>(message.type));
    writer.u32(message.request_id);
    encode_payload(writer, message.payload);
    return out;
}

std::optional<SignalMessage> decode(std::span<const std::uint8_t> buffer) {
    if (buffer.size() < kHeaderSize) {
        return std::nullopt;
    }

    WireReader reader(buffer);
    SignalMessage message{};
    std::uint8_t raw_type = 0;
    if (!reader.u8(message.version) || !reader.u8(raw_type) || !reader.u32(message.request_id)) {
        return std::nullopt;
    }
    if (message.version != kSignalVersion || !is_known_type(raw_type)) {
        return std::nullopt;
    }
    message.type = static_cast<SignalType>(raw_type);

    auto payload = decode_payload(message.type, reader);
    if (!payload.has_value() || !reader.at_end()) {
        return std::nullopt;
    }
    message.payload = std::move(*payload);
    return message;
}

std::vector<std::uint8_t> encode_frame(const SignalMessage& message) {
    const auto body = encode(message);
    std::vector<std::uint8_t> frame(kLengthPrefixSize + body.size());
    write_be32(frame.data(), static_cast<std::uint32_t>(body.size()));
    std::copy(body.begin(), body.end(), frame.begin() + kLengthPrefixSize);
    return frame;
}

FrameAssembler::FrameAssembler(std::size_t max_frame_size)
    : max_frame_size_(max_frame_size) {}

void FrameAssembler::append(std::span<const std::uint8_t> bytes) {
    if (overflowed_) {
        return;
    }
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

std::optional<std::vector<std::uint8_t>> FrameAssembler::next() {
    if (overflowed_ || buffer_.size() < kLengthPrefixSize) {
        return std::nullopt;
    }
    const auto length = static_cast<std::size_t>(read_be32(buffer_.data()));
    if (length > max_frame_size_) {
        overflowed_ = true;
        buffer_.clear();
        return std::nullopt;
    }
    if (buffer_.size() < kLengthPrefixSize + length) {
        return std::nullopt;
    }
    const auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(kLengthPrefixSize);
    const auto end = begin + static_cast<std::ptrdiff_t>(length);
    std::vector<std::uint8_t> frame(begin, end);
    buffer_.erase(buffer_.begin(), end);
    return frame;
}

SignalType push_signal_type(PushKind kind) noexcept {
    switch (kind) {
        case PushKind::FileAvailable:
            return SignalType::FileAvailable;
        case PushKind::SeedersUpdate:
            return SignalType::SeedersUpdate;
        case PushKind::UploaderOnline:
            return SignalType::UploaderOnline;
        case PushKind::AccessRevoked:
            return SignalType::AccessRevoked;
    }
    return SignalType::SeedersUpdate;
}

std::optional<PushKind> push_kind_for(SignalType type) noexcept {
    switch (type) {
        case SignalType::FileAvailable:
            return PushKind::FileAvailable;
        case SignalType::SeedersUpdate:
            return PushKind::SeedersUpdate;
        case SignalType::UploaderOnline:
            return PushKind::UploaderOnline;
        case SignalType::AccessRevoked:
            return PushKind::AccessRevoked;
        default:
            return std::nullopt;
    }
}

SignalType relay_signal_type(RelayKind kind) noexcept {
    switch (kind) {
        case RelayKind::Offer:
            return SignalType::Offer;
        case RelayKind::Answer:
            return SignalType::Answer;
        case RelayKind::IceCandidate:
            return SignalType::IceCandidate;
    }
    return SignalType::Offer;
}

std::optional<RelayKind> relay_kind_for(SignalType type) noexcept {
    switch (type) {
        case SignalType::Offer:
            return RelayKind::Offer;
        case SignalType::Answer:
            return RelayKind::Answer;
        case SignalType::IceCandidate:
            return RelayKind::IceCandidate;
        default:
            return std::nullopt;
    }
}

SignalMessage make_response(std::uint32_t request_id, const Status& status) {
    ResponsePayload body{};
    body.code = status.code;
    body.message = status.message;

    SignalMessage message{};
    message.type = SignalType::Response;
    message.request_id = request_id;
    message.payload = std::move(body);
    return message;
}

PushNotification to_push(PushKind kind, const NotifyPayload& payload) {
    PushNotification push{};
    push.kind = kind;
    push.file_id = payload.file_id;
    push.seeder_count = payload.seeder_count;
    push.chunk_quality = payload.chunk_quality;
    push.available_chunks = payload.available_chunks;
    return push;
}

NotifyPayload to_notify(const PushNotification& push) {
    NotifyPayload payload{};
    payload.file_id = push.file_id;
    payload.seeder_count = push.seeder_count;
    payload.chunk_quality = push.chunk_quality;
    payload.available_chunks = push.available_chunks;
    return payload;
}

}  // namespace swarmshare::protocol
