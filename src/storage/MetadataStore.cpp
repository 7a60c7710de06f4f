#include "swarmshare/storage/MetadataStore.hpp"

#include "swarmshare/logging/StructuredLogger.hpp"

#include <array>
#include <charconv>
#include <fstream>
#include <sstream>
#include <utility>

namespace swarmshare::storage {

namespace {

using logging::StructuredLogger;
using logging::log_event;

constexpr std::string_view kHeader = "#swarmshare-metadata v1";
constexpr std::size_t kColumnCount = 11;

struct StatusName {
    LocalFileStatus status;
    std::string_view name;
};

constexpr std::array<StatusName, 6> kStatusNames{{
    {LocalFileStatus::Uploading, "uploading"},
    {LocalFileStatus::Seeding, "seeding"},
    {LocalFileStatus::Downloading, "downloading"},
    {LocalFileStatus::Paused, "paused"},
    {LocalFileStatus::Partial, "partial"},
    {LocalFileStatus::Complete, "complete"},
}};

bool needs_escape(char ch) {
    return ch == '%' || ch == '\t' || ch == '\n' || ch == '\r' || ch == ',';
}

std::string escape_field(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (const char ch : value) {
        if (needs_escape(ch)) {
            const auto byte = static_cast<unsigned char>(ch);
            out.push_back('%');
            out.push_back(kHex[byte >> 4]);
            out.push_back(kHex[byte & 0x0F]);
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

std::optional<std::string> unescape_field(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '%') {
            out.push_back(value[i]);
            continue;
        }
        if (i + 2 >= value.size()) {
            return std::nullopt;
        }
        const auto bytes = from_hex(value.substr(i + 1, 2));
        if (!bytes.has_value() || bytes->size() != 1) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((*bytes)[0]));
        i += 2;
    }
    return out;
}

std::vector<std::string_view> split(std::string_view line, char separator) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = line.find(separator, start);
        if (pos == std::string_view::npos) {
            parts.push_back(line.substr(start));
            break;
        }
        parts.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

template <typename T>
bool parse_number(std::string_view text, T& value) {
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc{} && ptr == text.data() + text.size() && !text.empty();
}

std::string format_entry(const LocalFileEntry& entry) {
    std::string shared;
    for (std::size_t i = 0; i < entry.shared_with.size(); ++i) {
        if (i > 0) {
            shared.push_back(',');
        }
        shared += escape_field(entry.shared_with[i]);
    }

    std::ostringstream oss;
    oss << escape_field(entry.file_id) << '\t' << local_file_status_name(entry.status) << '\t'
        << escape_field(entry.checksum) << '\t' << entry.chunk_count << '\t' << entry.file_size << '\t' << shared
        << '\t' << escape_field(entry.file_key) << '\t' << escape_field(entry.file_name) << '\t'
        << escape_field(entry.mime_type) << '\t' << escape_field(entry.output_path) << '\t'
        << escape_field(entry.sender_id);
    return oss.str();
}

std::optional<LocalFileEntry> parse_entry(std::string_view line) {
    const auto columns = split(line, '\t');
    if (columns.size() != kColumnCount) {
        return std::nullopt;
    }

    LocalFileEntry entry{};
    const auto file_id = unescape_field(columns[0]);
    const auto status = local_file_status_from_name(columns[1]);
    const auto checksum = unescape_field(columns[2]);
    if (!file_id.has_value() || !status.has_value() || !checksum.has_value()) {
        return std::nullopt;
    }
    entry.file_id = *file_id;
    entry.status = *status;
    entry.checksum = *checksum;
    if (!parse_number(columns[3], entry.chunk_count) || !parse_number(columns[4], entry.file_size)) {
        return std::nullopt;
    }
    if (!columns[5].empty()) {
        for (const auto principal : split(columns[5], ',')) {
            auto value = unescape_field(principal);
            if (!value.has_value()) {
                return std::nullopt;
            }
            entry.shared_with.push_back(std::move(*value));
        }
    }

    std::array<std::string*, 5> tail{&entry.file_key, &entry.file_name, &entry.mime_type, &entry.output_path,
                                     &entry.sender_id};
    for (std::size_t i = 0; i < tail.size(); ++i) {
        auto value = unescape_field(columns[6 + i]);
        if (!value.has_value()) {
            return std::nullopt;
        }
        *tail[i] = std::move(*value);
    }
    return entry;
}

}  // namespace

std::string_view local_file_status_name(LocalFileStatus status) noexcept {
    for (const auto& [value, name] : kStatusNames) {
        if (value == status) {
            return name;
        }
    }
    return "unknown";
}

std::optional<LocalFileStatus> local_file_status_from_name(std::string_view name) noexcept {
    for (const auto& [value, text] : kStatusNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

MetadataStore::MetadataStore(std::filesystem::path path)
    : path_(std::move(path)) {}

bool MetadataStore::load() {
    std::scoped_lock lock(mutex_);
    if (path_.empty()) {
        return true;
    }

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return true;
    }

    std::ifstream stream(path_);
    if (!stream) {
        return false;
    }

    std::map<FileId, LocalFileEntry> loaded;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(stream, line)) {
        ++line_number;
        if (line.empty() || line.front() == '#') {
            continue;
        }
        auto entry = parse_entry(line);
        if (!entry.has_value()) {
            log_event(StructuredLogger::Level::Error,
                      "metadata.parse_failed",
                      {{"path", path_.string()}, {"line", std::to_string(line_number)}});
            return false;
        }
        auto key = entry->file_id;
        loaded.insert_or_assign(std::move(key), std::move(*entry));
    }
    entries_ = std::move(loaded);
    return true;
}

void MetadataStore::upsert(LocalFileEntry entry) {
    std::scoped_lock lock(mutex_);
    auto key = entry.file_id;
    entries_.insert_or_assign(std::move(key), std::move(entry));
    save_locked();
}

std::optional<LocalFileEntry> MetadataStore::get(const FileId& file_id) const {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(file_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MetadataStore::set_status(const FileId& file_id, LocalFileStatus status) {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(file_id);
    if (it == entries_.end()) {
        return false;
    }
    it->second.status = status;
    save_locked();
    return true;
}

bool MetadataStore::update_shared_with(const FileId& file_id, std::vector<PrincipalId> shared_with) {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(file_id);
    if (it == entries_.end()) {
        return false;
    }
    it->second.shared_with = std::move(shared_with);
    save_locked();
    return true;
}

bool MetadataStore::remove(const FileId& file_id) {
    std::scoped_lock lock(mutex_);
    if (entries_.erase(file_id) == 0) {
        return false;
    }
    save_locked();
    return true;
}

std::vector<LocalFileEntry> MetadataStore::list() const {
    std::scoped_lock lock(mutex_);
    std::vector<LocalFileEntry> result;
    result.reserve(entries_.size());
    for (const auto& [_, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

void MetadataStore::save_locked() const {
    if (path_.empty()) {
        return;
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    auto temp = path_;
    temp += ".tmp";
    {
        std::ofstream stream(temp, std::ios::trunc);
        if (!stream) {
            log_event(StructuredLogger::Level::Error, "metadata.save_failed", {{"path", temp.string()}});
            return;
        }
        stream << kHeader << '\n';
        for (const auto& [_, entry] : entries_) {
            stream << format_entry(entry) << '\n';
        }
        stream.flush();
        if (!stream) {
            log_event(StructuredLogger::Level::Error, "metadata.save_failed", {{"path", temp.string()}});
            return;
        }
    }
    std::filesystem::rename(temp, path_, ec);
    if (ec) {
        log_event(StructuredLogger::Level::Error,
                  "metadata.save_failed",
                  {{"path", path_.string()}, {"error", ec.message()}});
    }
}

}  // namespace swarmshare::storage
