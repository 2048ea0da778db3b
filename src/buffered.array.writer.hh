#pragma once

#include "chunked.array.hh"
#include "pzarr.common.hh"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace pzarr {
/**
 * @brief Stages rows of an array one chunk at a time and writes them out
 * chunk-aligned.
 * @details The staging buffer holds one chunk of rows along the first
 * dimension and the full extent of every other dimension. Each flush writes
 * the staged rows at the current array offset, reports the bytes written to
 * ProgressState, and moves the offset on by one chunk.
 */
class BufferedArrayWriter final
{
  public:
    /**
     * @param array The destination array.
     * @param offset First row to write. Must be chunk-aligned.
     * @throw std::invalid_argument if @p offset is not a multiple of the
     * array's first chunk size.
     */
    BufferedArrayWriter(std::shared_ptr<ChunkedArray> array, uint64_t offset);
    ~BufferedArrayWriter() noexcept;

    BufferedArrayWriter(const BufferedArrayWriter&) = delete;
    BufferedArrayWriter& operator=(const BufferedArrayWriter&) = delete;

    /**
     * @brief Claim the next row of the staging buffer, flushing first if the
     * buffer is full.
     * @return Index of the claimed row, for use with row() or row_as().
     */
    uint64_t next_row();

    /// @brief The bytes of staged row @p i.
    std::span<std::byte> row(uint64_t i);

    /// @brief The elements of staged row @p i.
    /// @throw std::invalid_argument if T does not match the array's dtype.
    template<typename T>
    std::span<T> row_as(uint64_t i)
    {
        EXPECT_VALID_ARGUMENT(sizeof(T) == bytes_of_type(array_->dtype()),
                              "Cannot view rows of ",
                              dtype_to_string(array_->dtype()),
                              " as elements of size ",
                              sizeof(T));

        auto bytes = row(i);
        return { reinterpret_cast<T*>(bytes.data()), bytes.size() / sizeof(T) };
    }

    /// @brief Write staged rows to the array. Does nothing if none are
    /// staged.
    void flush();

    /// @brief Write any remaining staged rows.
    void close();

    [[nodiscard]] uint64_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] uint64_t array_offset() const noexcept
    {
        return array_offset_;
    }
    [[nodiscard]] uint64_t buffer_row() const noexcept { return buffer_row_; }
    [[nodiscard]] size_t bytes_per_row() const noexcept
    {
        return bytes_per_row_;
    }

  private:
    std::shared_ptr<ChunkedArray> array_;

    uint64_t chunk_size_;
    size_t bytes_per_row_;
    std::vector<std::byte> buffer_;

    uint64_t array_offset_;
    uint64_t buffer_row_;

    void flush_rows_();
    void flush_slabs_();
};
} // namespace pzarr
