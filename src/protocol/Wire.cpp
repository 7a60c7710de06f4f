#include "swarmshare/protocol/Wire.hpp"

#include <algorithm>
#include <utility>

namespace swarmshare::protocol {

void WireWriter::u8(std::uint8_t value) {
    out_.push_back(value);
}

void WireWriter::u16(std::uint16_t value) {
    out_.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out_.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void WireWriter::u32(std::uint32_t value) {
    out_.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
    out_.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    out_.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out_.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void WireWriter::u64(std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

void WireWriter::raw(std::span<const std::uint8_t> bytes) {
    out_.insert(out_.end(), bytes.begin(), bytes.end());
}

void WireWriter::blob(std::span<const std::uint8_t> bytes) {
    u32(static_cast<std::uint32_t>(bytes.size()));
    raw(bytes);
}

void WireWriter::string(std::string_view value) {
    u32(static_cast<std::uint32_t>(value.size()));
    out_.insert(out_.end(), value.begin(), value.end());
}

void WireWriter::u32_list(const std::vector<std::uint32_t>& values) {
    u32(static_cast<std::uint32_t>(values.size()));
    for (const auto value : values) {
        u32(value);
    }
}

void WireWriter::string_list(const std::vector<std::string>& values) {
    u32(static_cast<std::uint32_t>(values.size()));
    for (const auto& value : values) {
        string(value);
    }
}

bool WireReader::u8(std::uint8_t& value) {
    if (remaining() < 1) {
        return false;
    }
    value = data_[cursor_++];
    return true;
}

bool WireReader::u16(std::uint16_t& value) {
    if (remaining() < 2) {
        return false;
    }
    value = static_cast<std::uint16_t>((static_cast<std::uint16_t>(data_[cursor_]) << 8) | data_[cursor_ + 1]);
    cursor_ += 2;
    return true;
}

bool WireReader::u32(std::uint32_t& value) {
    if (remaining() < 4) {
        return false;
    }
    value = read_be32(data_.data() + cursor_);
    cursor_ += 4;
    return true;
}

bool WireReader::u64(std::uint64_t& value) {
    if (remaining() < 8) {
        return false;
    }
    value = 0;
    for (int index = 0; index < 8; ++index) {
        value = (value << 8) | static_cast<std::uint64_t>(data_[cursor_++]);
    }
    return true;
}

bool WireReader::raw(std::span<std::uint8_t> out) {
    if (remaining() < out.size()) {
        return false;
    }
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(cursor_), out.size(), out.begin());
    cursor_ += out.size();
    return true;
}

bool WireReader::blob(std::vector<std::uint8_t>& out) {
    std::uint32_t length = 0;
    if (!u32(length) || remaining() < length) {
        return false;
    }
    out.assign(data_.begin() + static_cast<std::ptrdiff_t>(cursor_),
               data_.begin() + static_cast<std::ptrdiff_t>(cursor_ + length));
    cursor_ += length;
    return true;
}

bool WireReader::string(std::string& out) {
    std::uint32_t length = 0;
    if (!u32(length) || remaining() < length) {
        return false;
    }
    out.assign(reinterpret_cast<const char*>(data_.data() + cursor_), length);
    cursor_ += length;
    return true;
}

bool WireReader::u32_list(std::vector<std::uint32_t>& out) {
    std::uint32_t count = 0;
    if (!u32(count) || remaining() / 4 < count) {
        return false;
    }
    out.clear();
    out.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        std::uint32_t value = 0;
        if (!u32(value)) {
            return false;
        }
        out.push_back(value);
    }
    return true;
}

bool WireReader::string_list(std::vector<std::string>& out) {
    std::uint32_t count = 0;
    // Each entry needs at least its length prefix.
    if (!u32(count) || remaining() / 4 < count) {
        return false;
    }
    out.clear();
    out.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        std::string value;
        if (!string(value)) {
            return false;
        }
        out.push_back(std::move(value));
    }
    return true;
}

std::uint32_t read_be32(const std::uint8_t* data) noexcept {
    return (static_cast<std::uint32_t>(data[0]) << 24) |
           (static_cast<std::uint32_t>(data[1]) << 16) |
           (static_cast<std::uint32_t>(data[2]) << 8) |
           static_cast<std::uint32_t>(data[3]);
}

void write_be32(std::uint8_t* data, std::uint32_t value) noexcept {
    data[0] = static_cast<std::uint8_t>((value >> 24) & 0xFFu);
    data[1] = static_cast<std::uint8_t>((value >> 16) & 0xFFu);
    data[2] = static_cast<std::uint8_t>((value >> 8) & 0xFFu);
    data[3] = static_cast<std::uint8_t>(value & 0xFFu);
}

}  // namespace swarmshare::protocol
