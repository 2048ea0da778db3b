#include "buffered.array.writer.hh"
#include "macros.hh"
#include "progress.state.hh"

#include <algorithm>
#include <cstring>

pzarr::BufferedArrayWriter::BufferedArrayWriter(
  std::shared_ptr<ChunkedArray> array,
  uint64_t offset)
  : array_{ std::move(array) }
  , chunk_size_{ 0 }
  , bytes_per_row_{ 0 }
  , array_offset_{ offset }
  , buffer_row_{ 0 }
{
    EXPECT_VALID_ARGUMENT(array_, "Destination array must not be null");
    EXPECT_VALID_ARGUMENT(array_->ndims() > 0,
                          "Destination array must have at least one dimension");

    const auto shape = array_->shape();
    const auto chunks = array_->chunks();
    EXPECT_VALID_ARGUMENT(chunks[0] > 0 && offset % chunks[0] == 0,
                          "Offset ",
                          offset,
                          " is not a multiple of the chunk size ",
                          chunks[0]);

    chunk_size_ = std::min(chunks[0], shape[0]);

    bytes_per_row_ = bytes_of_type(array_->dtype());
    for (auto i = 1; i < shape.size(); ++i) {
        bytes_per_row_ *= shape[i];
    }

    // zero-filled up front, so a buffer too large for memory fails here
    buffer_.resize(chunk_size_ * bytes_per_row_);
}

pzarr::BufferedArrayWriter::~BufferedArrayWriter() noexcept
{
    if (buffer_row_ == 0) {
        return;
    }

    try {
        flush();
    } catch (const std::exception& exc) {
        LOG_ERROR("Failed to flush ", buffer_row_, " rows: ", exc.what());
    }
}

uint64_t
pzarr::BufferedArrayWriter::next_row()
{
    CHECK(chunk_size_ > 0);

    if (buffer_row_ == chunk_size_) {
        flush();
    }

    return buffer_row_++;
}

std::span<std::byte>
pzarr::BufferedArrayWriter::row(uint64_t i)
{
    EXPECT(i < chunk_size_,
           "Row ",
           i,
           " is out of bounds for a buffer of ",
           chunk_size_,
           " rows");

    return { buffer_.data() + i * bytes_per_row_, bytes_per_row_ };
}

void
pzarr::BufferedArrayWriter::flush()
{
    if (buffer_row_ == 0) {
        return;
    }

    if (array_->ndims() == 1) {
        flush_rows_();
    } else {
        flush_slabs_();
    }

    LOG_DEBUG("Flushed rows [",
              array_offset_,
              ", ",
              array_offset_ + buffer_row_,
              ") from a buffer of ",
              buffer_.size(),
              " bytes");

    array_offset_ += chunk_size_;
    buffer_row_ = 0;
}

void
pzarr::BufferedArrayWriter::close()
{
    if (buffer_row_ > 0) {
        flush();
    }
}

void
pzarr::BufferedArrayWriter::flush_rows_()
{
    const size_t nbytes = buffer_row_ * bytes_per_row_;

    array_->write_region({ array_offset_ },
                         { buffer_row_ },
                         { buffer_.data(), nbytes });
    ProgressState::increment(nbytes);
}

void
pzarr::BufferedArrayWriter::flush_slabs_()
{
    const auto shape = array_->shape();
    const auto chunks = array_->chunks();
    if (shape[1] == 0) {
        return;
    }

    // bytes of one element along dimension 1
    const size_t bytes_per_column = bytes_per_row_ / shape[1];
    const uint64_t slab_width = chunks[1] > 0 ? chunks[1] : shape[1];

    std::vector<uint64_t> offset(shape.size(), 0);
    std::vector<uint64_t> extent(shape);
    offset[0] = array_offset_;
    extent[0] = buffer_row_;

    std::vector<std::byte> slab;
    for (uint64_t col = 0; col < shape[1]; col += slab_width) {
        const uint64_t width = std::min(slab_width, shape[1] - col);
        const size_t bytes_per_slab_row = width * bytes_per_column;

        slab.resize(buffer_row_ * bytes_per_slab_row);
        for (auto r = 0; r < buffer_row_; ++r) {
            std::memcpy(slab.data() + r * bytes_per_slab_row,
                        buffer_.data() + r * bytes_per_row_ +
                          col * bytes_per_column,
                        bytes_per_slab_row);
        }

        offset[1] = col;
        extent[1] = width;
        array_->write_region(offset, extent, slab);
        ProgressState::increment(slab.size());
    }
}
