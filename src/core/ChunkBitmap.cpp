#include "swarmshare/core/ChunkBitmap.hpp"

#include <bit>

namespace swarmshare {

namespace {
constexpr std::uint32_t kWordBits = 64;
}

ChunkBitmap::ChunkBitmap(std::uint32_t size)
    : size_(size), words_((size + kWordBits - 1) / kWordBits, 0) {}

ChunkBitmap ChunkBitmap::full(std::uint32_t size) {
    ChunkBitmap bitmap(size);
    for (ChunkIndex index = 0; index < size; ++index) {
        bitmap.set(index);
    }
    return bitmap;
}

ChunkBitmap ChunkBitmap::from_indices(std::uint32_t size, std::span<const ChunkIndex> indices) {
    ChunkBitmap bitmap(size);
    for (const auto index : indices) {
        bitmap.set(index);
    }
    return bitmap;
}

bool ChunkBitmap::test(ChunkIndex index) const noexcept {
    if (index >= size_) {
        return false;
    }
    return (words_[index / kWordBits] >> (index % kWordBits)) & 1u;
}

bool ChunkBitmap::set(ChunkIndex index) noexcept {
    if (index >= size_ || test(index)) {
        return false;
    }
    words_[index / kWordBits] |= (std::uint64_t{1} << (index % kWordBits));
    ++count_;
    return true;
}

void ChunkBitmap::reset(ChunkIndex index) noexcept {
    if (!test(index)) {
        return;
    }
    words_[index / kWordBits] &= ~(std::uint64_t{1} << (index % kWordBits));
    --count_;
}

void ChunkBitmap::clear() noexcept {
    for (auto& word : words_) {
        word = 0;
    }
    count_ = 0;
}

std::vector<ChunkIndex> ChunkBitmap::indices() const {
    std::vector<ChunkIndex> result;
    result.reserve(count_);
    for (ChunkIndex index = 0; index < size_; ++index) {
        if (test(index)) {
            result.push_back(index);
        }
    }
    return result;
}

std::vector<ChunkIndex> ChunkBitmap::missing() const {
    std::vector<ChunkIndex> result;
    result.reserve(size_ - count_);
    for (ChunkIndex index = 0; index < size_; ++index) {
        if (!test(index)) {
            result.push_back(index);
        }
    }
    return result;
}

void ChunkBitmap::merge(const ChunkBitmap& other) noexcept {
    if (other.size_ != size_) {
        return;
    }
    std::uint32_t total = 0;
    for (std::size_t i = 0; i < words_.size(); ++i) {
        words_[i] |= other.words_[i];
        total += static_cast<std::uint32_t>(std::popcount(words_[i]));
    }
    count_ = total;
}

bool ChunkBitmap::has_chunks_missing_from(const ChunkBitmap& other) const noexcept {
    if (other.size_ != size_) {
        return false;
    }
    for (std::size_t i = 0; i < words_.size(); ++i) {
        if ((other.words_[i] & ~words_[i]) != 0) {
            return true;
        }
    }
    return false;
}

}  // namespace swarmshare
