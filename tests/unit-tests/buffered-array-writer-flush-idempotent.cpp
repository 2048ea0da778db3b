#include "buffered.array.writer.hh"
#include "progress.state.hh"
#include "unit.test.macros.hh"

#include <cstring>
#include <utility>
#include <vector>

namespace {
/// Keeps the array in memory and records every region written to it.
class RecordingArray final : public pzarr::ChunkedArray
{
  public:
    RecordingArray(uint64_t array_size, uint64_t chunk_size)
      : dims_{ { "variants", array_size, chunk_size } }
      , data_(array_size * sizeof(uint16_t))
    {
    }

    const std::vector<pzarr::ArrayDimension>& dimensions() const override
    {
        return dims_;
    }
    PzarrDataType dtype() const override { return PzarrDataType_uint16; }

    void write_region(const std::vector<uint64_t>& offset,
                      const std::vector<uint64_t>& extent,
                      std::span<const std::byte> data) override
    {
        check_region_(offset, extent, data.size());
        std::memcpy(
          data_.data() + offset[0] * sizeof(uint16_t), data.data(), data.size());
        writes.emplace_back(offset[0], extent[0]);
    }

    void read_region(const std::vector<uint64_t>& offset,
                     const std::vector<uint64_t>& extent,
                     std::span<std::byte> out) const override
    {
        check_region_(offset, extent, out.size());
        std::memcpy(
          out.data(), data_.data() + offset[0] * sizeof(uint16_t), out.size());
    }

    uint16_t at(uint64_t i) const
    {
        uint16_t v;
        std::memcpy(&v, data_.data() + i * sizeof(uint16_t), sizeof(v));
        return v;
    }

    // (offset, extent) of each write, in order
    std::vector<std::pair<uint64_t, uint64_t>> writes;

  private:
    std::vector<pzarr::ArrayDimension> dims_;
    std::vector<std::byte> data_;
};
} // namespace

int
main()
{
    int retval = 0;

    try {
        pzarr::ProgressState::set(0);

        auto array = std::make_shared<RecordingArray>(10, 4);

        {
            pzarr::BufferedArrayWriter writer(array, 0);

            // nothing staged, nothing written
            writer.flush();
            CHECK(array->writes.empty());
            EXPECT_EQ(uint64_t, writer.array_offset(), 0);

            for (auto i = 0; i < 3; ++i) {
                const auto row = writer.next_row();
                EXPECT_EQ(uint64_t, row, i);
                writer.row_as<uint16_t>(row)[0] = static_cast<uint16_t>(i + 1);
            }
            writer.flush();
            EXPECT_EQ(size_t, array->writes.size(), 1);
            CHECK((array->writes[0] == std::pair<uint64_t, uint64_t>{ 0, 3 }));
            EXPECT_EQ(uint64_t, pzarr::ProgressState::read(), 3 * 2);

            // the offset moves on by a whole chunk, however few rows were
            // staged
            EXPECT_EQ(uint64_t, writer.array_offset(), 4);
            EXPECT_EQ(uint64_t, writer.buffer_row(), 0);

            writer.flush();
            writer.close();
            EXPECT_EQ(size_t, array->writes.size(), 1);
            EXPECT_EQ(uint64_t, pzarr::ProgressState::read(), 3 * 2);

            // a full buffer is flushed on the next claim, not before
            for (auto i = 0; i < 4; ++i) {
                const auto row = writer.next_row();
                writer.row_as<uint16_t>(row)[0] = static_cast<uint16_t>(10 + i);
            }
            EXPECT_EQ(size_t, array->writes.size(), 1);
            EXPECT_EQ(uint64_t, writer.next_row(), 0);
            EXPECT_EQ(size_t, array->writes.size(), 2);
            CHECK((array->writes[1] == std::pair<uint64_t, uint64_t>{ 4, 4 }));
            writer.row_as<uint16_t>(0)[0] = 20;

            // the last staged row is written on destruction
        }

        EXPECT_EQ(size_t, array->writes.size(), 3);
        CHECK((array->writes[2] == std::pair<uint64_t, uint64_t>{ 8, 1 }));
        EXPECT_EQ(uint64_t, pzarr::ProgressState::read(), 8 * 2);

        const uint16_t expected[] = { 1, 2, 3, 0, 10, 11, 12, 13, 20, 0 };
        for (auto i = 0; i < 10; ++i) {
            EXPECT_EQ(int, array->at(i), expected[i]);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
