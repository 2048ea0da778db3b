#pragma once

#include "pzarr.types.h"

#include <cstddef> // std::byte
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pzarr {
struct ArrayDimension
{
    ArrayDimension() = default;
    ArrayDimension(std::string_view name,
                   uint64_t array_size,
                   uint64_t chunk_size)
      : name(name)
      , array_size(array_size)
      , chunk_size(chunk_size)
    {
    }

    std::string name;
    uint64_t array_size{ 0 };
    uint64_t chunk_size{ 0 };
};

/**
 * @brief A fixed-geometry, chunked, N-dimensional array in some store.
 * @details Regions are hyperrectangles given by a per-dimension offset and
 * extent. Region buffers are C-ordered (the last dimension varies fastest)
 * and hold elements of the array's data type.
 */
class ChunkedArray
{
  public:
    virtual ~ChunkedArray() = default;

    virtual const std::vector<ArrayDimension>& dimensions() const = 0;
    virtual PzarrDataType dtype() const = 0;

    /**
     * @brief Write a region of the array.
     * @param offset Index of the first element of the region, per dimension.
     * @param extent Size of the region, per dimension.
     * @param data C-ordered region contents.
     * @throw std::invalid_argument if the region lies outside the array or
     * @p data has the wrong size.
     * @throw std::runtime_error on I/O failure.
     */
    virtual void write_region(const std::vector<uint64_t>& offset,
                              const std::vector<uint64_t>& extent,
                              std::span<const std::byte> data) = 0;

    /**
     * @brief Read a region of the array into @p out.
     * @throw std::invalid_argument if the region lies outside the array or
     * @p out has the wrong size.
     * @throw std::runtime_error on I/O failure.
     */
    virtual void read_region(const std::vector<uint64_t>& offset,
                             const std::vector<uint64_t>& extent,
                             std::span<std::byte> out) const = 0;

    size_t ndims() const { return dimensions().size(); }
    std::vector<uint64_t> shape() const;
    std::vector<uint64_t> chunks() const;

  protected:
    /**
     * @brief Validate a region against the array's shape, and a region buffer
     * of @p bytes_of_buf bytes against the region's size.
     * @throw std::invalid_argument on any mismatch.
     */
    void check_region_(const std::vector<uint64_t>& offset,
                       const std::vector<uint64_t>& extent,
                       size_t bytes_of_buf) const;
};
} // namespace pzarr
