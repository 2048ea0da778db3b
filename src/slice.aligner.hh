#pragma once

#include "chunked.array.hh"

#include <cstdint>
#include <optional>
#include <vector>

namespace pzarr {
/// A half-open range of rows, [start, stop), along an array's first
/// dimension.
struct RowSlice
{
    uint64_t start{ 0 };
    uint64_t stop{ 0 };

    bool operator==(const RowSlice&) const = default;
};

/**
 * @brief Split the first @p max_chunks chunks (all of them if unset) of a
 * dimension of @p shape0 rows into at most @p n contiguous, chunk-aligned,
 * disjoint slices.
 * @details Slice sizes, in chunks, differ by at most one, with the larger
 * slices first. Exactly min(n, number of chunks) slices are returned, in
 * order. The final slice is clipped to @p shape0.
 * @throw std::invalid_argument if @p chunk_size or @p n is zero.
 */
std::vector<RowSlice>
chunk_aligned_slices(uint64_t shape0,
                     uint64_t chunk_size,
                     uint32_t n,
                     std::optional<uint64_t> max_chunks = std::nullopt);

/// @brief Split the first dimension of @p array as above.
std::vector<RowSlice>
chunk_aligned_slices(const ChunkedArray& array,
                     uint32_t n,
                     std::optional<uint64_t> max_chunks = std::nullopt);
} // namespace pzarr
