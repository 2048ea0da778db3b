#include "slice.aligner.hh"
#include "macros.hh"
#include "pzarr.common.hh"

#include <algorithm>

std::vector<pzarr::RowSlice>
pzarr::chunk_aligned_slices(uint64_t shape0,
                            uint64_t chunk_size,
                            uint32_t n,
                            std::optional<uint64_t> max_chunks)
{
    EXPECT_VALID_ARGUMENT(chunk_size > 0, "Chunk size must be positive");
    EXPECT_VALID_ARGUMENT(n > 0, "Number of slices must be positive");

    uint64_t n_chunks = chunks_along_dimension(shape0, chunk_size);
    if (max_chunks) {
        n_chunks = std::min(n_chunks, *max_chunks);
    }

    const uint64_t n_slices = std::min<uint64_t>(n, n_chunks);

    std::vector<RowSlice> slices;
    slices.reserve(n_slices);

    // the first (n_chunks % n_slices) slices take one extra chunk each
    const uint64_t base = n_slices ? n_chunks / n_slices : 0;
    const uint64_t extra = n_slices ? n_chunks % n_slices : 0;

    uint64_t first_chunk = 0;
    for (auto i = 0; i < n_slices; ++i) {
        const uint64_t chunks_in_slice = base + (i < extra ? 1 : 0);
        const uint64_t start = first_chunk * chunk_size;
        const uint64_t stop =
          std::min((first_chunk + chunks_in_slice) * chunk_size, shape0);

        slices.push_back({ start, stop });
        first_chunk += chunks_in_slice;
    }

    return slices;
}

std::vector<pzarr::RowSlice>
pzarr::chunk_aligned_slices(const ChunkedArray& array,
                            uint32_t n,
                            std::optional<uint64_t> max_chunks)
{
    const auto& dims = array.dimensions();
    EXPECT_VALID_ARGUMENT(!dims.empty(), "Array has no dimensions");

    return chunk_aligned_slices(
      dims.front().array_size, dims.front().chunk_size, n, max_chunks);
}
