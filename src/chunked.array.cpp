#include "chunked.array.hh"
#include "macros.hh"
#include "pzarr.common.hh"

std::vector<uint64_t>
pzarr::ChunkedArray::shape() const
{
    std::vector<uint64_t> shape;
    for (const auto& dim : dimensions()) {
        shape.push_back(dim.array_size);
    }
    return shape;
}

std::vector<uint64_t>
pzarr::ChunkedArray::chunks() const
{
    std::vector<uint64_t> chunks;
    for (const auto& dim : dimensions()) {
        chunks.push_back(dim.chunk_size);
    }
    return chunks;
}

void
pzarr::ChunkedArray::check_region_(const std::vector<uint64_t>& offset,
                                   const std::vector<uint64_t>& extent,
                                   size_t bytes_of_buf) const
{
    const auto& dims = dimensions();
    EXPECT_VALID_ARGUMENT(offset.size() == dims.size() &&
                            extent.size() == dims.size(),
                          "Region has ",
                          offset.size(),
                          " offsets and ",
                          extent.size(),
                          " extents, but the array has ",
                          dims.size(),
                          " dimensions");

    size_t expected_bytes = bytes_of_type(dtype());
    for (auto i = 0; i < dims.size(); ++i) {
        EXPECT_VALID_ARGUMENT(offset[i] <= dims[i].array_size &&
                                extent[i] <= dims[i].array_size - offset[i],
                              "Region [",
                              offset[i],
                              ", ",
                              offset[i] + extent[i],
                              ") exceeds dimension '",
                              dims[i].name,
                              "' of size ",
                              dims[i].array_size);
        expected_bytes *= extent[i];
    }

    EXPECT_VALID_ARGUMENT(bytes_of_buf == expected_bytes,
                          "Expected a region buffer of ",
                          expected_bytes,
                          " bytes, got ",
                          bytes_of_buf);
}
