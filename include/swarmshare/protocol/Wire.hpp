#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace swarmshare::protocol {

// Big-endian encoder shared by the signaling and peer codecs.
class WireWriter {
public:
    explicit WireWriter(std::vector<std::uint8_t>& out) : out_(out) {}

    void u8(std::uint8_t value);
    void u16(std::uint16_t value);
    void u32(std::uint32_t value);
    void u64(std::uint64_t value);
    void raw(std::span<const std::uint8_t> bytes);
    // u32 length prefix.
    void blob(std::span<const std::uint8_t> bytes);
    void string(std::string_view value);
    void u32_list(const std::vector<std::uint32_t>& values);
    void string_list(const std::vector<std::string>& values);

private:
    std::vector<std::uint8_t>& out_;
};

// Every read returns false on truncation or when a length prefix exceeds what remains.
class WireReader {
public:
    explicit WireReader(std::span<const std::uint8_t> data) : data_(data) {}

    bool u8(std::uint8_t& value);
    bool u16(std::uint16_t& value);
    bool u32(std::uint32_t& value);
    bool u64(std::uint64_t& value);
    bool raw(std::span<std::uint8_t> out);
    bool blob(std::vector<std::uint8_t>& out);
    bool string(std::string& out);
    bool u32_list(std::vector<std::uint32_t>& out);
    bool string_list(std::vector<std::string>& out);

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - cursor_; }
    [[nodiscard]] bool at_end() const noexcept { return cursor_ == data_.size(); }

private:
    std::span<const std::uint8_t> data_;
    std::size_t cursor_{0};
};

std::uint32_t read_be32(const std::uint8_t* data) noexcept;
void write_be32(std::uint8_t* data, std::uint32_t value) noexcept;

}  // namespace swarmshare::protocol
