#pragma once

#include "swarmshare/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace swarmshare {

// Fixed-size set of chunk indices for one file.
class ChunkBitmap {
public:
    ChunkBitmap() = default;
    explicit ChunkBitmap(std::uint32_t size);

    static ChunkBitmap full(std::uint32_t size);
    // Indices outside [0, size) are ignored.
    static ChunkBitmap from_indices(std::uint32_t size, std::span<const ChunkIndex> indices);

    [[nodiscard]] std::uint32_t size() const noexcept { return size_; }
    [[nodiscard]] bool test(ChunkIndex index) const noexcept;
    // Returns true when the bit was not already set.
    bool set(ChunkIndex index) noexcept;
    void reset(ChunkIndex index) noexcept;
    void clear() noexcept;

    [[nodiscard]] std::uint32_t count() const noexcept { return count_; }
    [[nodiscard]] bool complete() const noexcept { return size_ > 0 && count_ == size_; }
    [[nodiscard]] bool empty() const noexcept { return count_ == 0; }

    std::vector<ChunkIndex> indices() const;
    std::vector<ChunkIndex> missing() const;

    // Union; sizes must match, a mismatched bitmap is ignored.
    void merge(const ChunkBitmap& other) noexcept;

    // True when `other` holds at least one index this bitmap lacks.
    [[nodiscard]] bool has_chunks_missing_from(const ChunkBitmap& other) const noexcept;

    bool operator==(const ChunkBitmap&) const = default;

private:
    std::uint32_t size_{0};
    std::uint32_t count_{0};
    std::vector<std::uint64_t> words_;
};

}  // namespace swarmshare
