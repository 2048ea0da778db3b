#include "buffered.array.writer.hh"
#include "zarrv2.array.hh"
#include "unit.test.macros.hh"

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

int
main()
{
    int retval = 0;
    const fs::path base_dir = fs::temp_directory_path() / TEST;

    try {
        pzarr::ZarrV2ArrayConfig config{
            .store_path = (base_dir / "array.zarr").string(),
            .dimensions = { { "variants", 10, 4 }, { "samples", 3, 2 } },
            .dtype = PzarrDataType_int8,
        };
        std::shared_ptr<pzarr::ChunkedArray> array =
          pzarr::ZarrV2Array::create(config);

        EXPECT_THROWS(std::invalid_argument,
                      pzarr::BufferedArrayWriter(array, 2));
        EXPECT_THROWS(std::invalid_argument,
                      pzarr::BufferedArrayWriter(array, 5));

        {
            pzarr::BufferedArrayWriter writer(array, 8);
            EXPECT_EQ(uint64_t, writer.array_offset(), 8);
            EXPECT_EQ(uint64_t, writer.chunk_size(), 4);
            EXPECT_EQ(uint64_t, writer.buffer_row(), 0);
            EXPECT_EQ(size_t, writer.bytes_per_row(), 3);

            // the staging buffer starts zero-filled
            for (const auto& b : writer.row(3)) {
                CHECK(b == std::byte{ 0 });
            }

            EXPECT_THROWS(std::runtime_error, writer.row(4));
            EXPECT_THROWS(std::invalid_argument, writer.row_as<int32_t>(0));
            EXPECT_EQ(size_t, writer.row_as<int8_t>(0).size(), 3);
        }

        // the buffer is clipped to arrays shorter than one chunk
        config.store_path = (base_dir / "short.zarr").string();
        config.dimensions = { { "variants", 3, 100 } };
        std::shared_ptr<pzarr::ChunkedArray> short_array =
          pzarr::ZarrV2Array::create(config);

        pzarr::BufferedArrayWriter writer(short_array, 0);
        EXPECT_EQ(uint64_t, writer.chunk_size(), 3);
        EXPECT_EQ(size_t, writer.bytes_per_row(), 1);
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
