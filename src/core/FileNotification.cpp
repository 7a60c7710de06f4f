#include "swarmshare/core/FileNotification.hpp"

#include "swarmshare/integrity/IntegrityVerifier.hpp"

#include <charconv>
#include <map>
#include <optional>
#include <sstream>

namespace swarmshare {

namespace {

std::string escape_value(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (const auto ch : value) {
        switch (ch) {
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                out.push_back(ch);
                break;
        }
    }
    return out;
}

std::optional<std::string> unescape_value(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '\\') {
            out.push_back(value[i]);
            continue;
        }
        if (i + 1 >= value.size()) {
            return std::nullopt;
        }
        switch (value[++i]) {
            case '\\':
                out.push_back('\\');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            default:
                return std::nullopt;
        }
    }
    return out;
}

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::string serialize_notification(const FileNotification& notification) {
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(notification.timestamp.time_since_epoch()).count();

    std::ostringstream out;
    out << "fileId=" << escape_value(notification.file_id) << '\n'
        << "fileName=" << escape_value(notification.file_name) << '\n'
        << "mimeType=" << escape_value(notification.mime_type) << '\n'
        << "fileSizeBytes=" << notification.file_size << '\n'
        << "chunkCount=" << notification.chunk_count << '\n'
        << "checksum=" << notification.checksum << '\n'
        << "fileKey=" << crypto::file_key_to_string(notification.file_key) << '\n'
        << "senderId=" << escape_value(notification.sender_id) << '\n'
        << "timestamp=" << millis << '\n';
    return out.str();
}

Result<FileNotification> parse_notification(std::string_view text) {
    std::map<std::string, std::string, std::less<>> fields;
    while (!text.empty()) {
        const auto newline = text.find('\n');
        auto line = text.substr(0, newline);
        text = newline == std::string_view::npos ? std::string_view{} : text.substr(newline + 1);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            return make_failure<FileNotification>(ErrorCode::InvalidArgument, "malformed notification line");
        }
        auto value = unescape_value(line.substr(eq + 1));
        if (!value) {
            return make_failure<FileNotification>(ErrorCode::InvalidArgument, "bad escape in notification");
        }
        fields[std::string(line.substr(0, eq))] = std::move(*value);
    }

    const auto field = [&fields](std::string_view key) -> const std::string* {
        const auto it = fields.find(key);
        return it == fields.end() ? nullptr : &it->second;
    };

    for (const auto* key : {"fileId", "fileSizeBytes", "chunkCount", "checksum", "fileKey", "senderId"}) {
        if (field(key) == nullptr) {
            return make_failure<FileNotification>(ErrorCode::InvalidArgument, std::string("notification lacks ") + key);
        }
    }

    FileNotification notification;
    notification.file_id = *field("fileId");
    if (!is_valid_file_id(notification.file_id)) {
        return make_failure<FileNotification>(ErrorCode::InvalidArgument, "invalid fileId");
    }
    if (const auto* name = field("fileName")) {
        notification.file_name = *name;
    }
    if (const auto* mime = field("mimeType")) {
        notification.mime_type = *mime;
    }

    const auto size = parse_number<std::uint64_t>(*field("fileSizeBytes"));
    const auto count = parse_number<std::uint32_t>(*field("chunkCount"));
    if (!size || !count) {
        return make_failure<FileNotification>(ErrorCode::InvalidArgument, "invalid size or chunk count");
    }
    notification.file_size = *size;
    notification.chunk_count = *count;

    notification.checksum = *field("checksum");
    if (!integrity::IntegrityVerifier::is_valid_checksum(notification.checksum)) {
        return make_failure<FileNotification>(ErrorCode::InvalidArgument, "invalid checksum");
    }

    const auto key = crypto::file_key_from_string(*field("fileKey"));
    if (!key) {
        return make_failure<FileNotification>(ErrorCode::InvalidArgument, "invalid file key");
    }
    notification.file_key = *key;
    notification.sender_id = *field("senderId");

    if (const auto* stamp = field("timestamp")) {
        const auto millis = parse_number<std::int64_t>(*stamp);
        if (!millis) {
            return make_failure<FileNotification>(ErrorCode::InvalidArgument, "invalid timestamp");
        }
        notification.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(*millis));
    }
    return make_result(std::move(notification));
}

}  // namespace swarmshare
