#include "buffered.array.writer.hh"
#include "progress.state.hh"
#include "zarrv2.array.hh"
#include "unit.test.macros.hh"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace {
const uint64_t array_size = 23, chunk_size = 5;
} // namespace

int
main()
{
    int retval = 0;
    const fs::path base_dir = fs::temp_directory_path() / TEST;

    try {
        pzarr::ZarrV2ArrayConfig config{
            .store_path = (base_dir / "positions.zarr").string(),
            .dimensions = { { "variants", array_size, chunk_size } },
            .dtype = PzarrDataType_int64,
            .compression_params = pzarr::BloscCompressionParams("lz4", 5, 1),
        };
        auto array = pzarr::ZarrV2Array::create(config);

        pzarr::ProgressState::set(0);

        // two writers over disjoint chunk-aligned ranges, as two units would
        {
            pzarr::BufferedArrayWriter first(array, 0);
            for (auto i = 0; i < 10; ++i) {
                first.row_as<int64_t>(first.next_row())[0] = 1000 + i;
            }
            first.close();
            EXPECT_EQ(uint64_t, first.array_offset(), 10);
        }
        {
            pzarr::BufferedArrayWriter second(array, 10);
            for (auto i = 10; i < array_size; ++i) {
                second.row_as<int64_t>(second.next_row())[0] = 1000 + i;
            }
            second.close();
        }

        EXPECT_EQ(uint64_t,
                  pzarr::ProgressState::read(),
                  array_size * sizeof(int64_t));

        auto reopened = pzarr::ZarrV2Array::open(config.store_path);
        std::vector<int64_t> values(array_size);
        reopened->read_region(
          { 0 }, { array_size }, std::as_writable_bytes(std::span(values)));
        for (auto i = 0; i < array_size; ++i) {
            EXPECT_EQ(int64_t, values[i], 1000 + i);
        }

        // 5 chunks, the last one ragged
        for (auto i = 0; i < 5; ++i) {
            CHECK(fs::is_regular_file(fs::path(config.store_path) /
                                      std::to_string(i)));
        }
        CHECK(!fs::exists(fs::path(config.store_path) / "5"));

        // writing past the end of the array fails
        pzarr::BufferedArrayWriter overrun(array, 20);
        for (auto i = 0; i < 5; ++i) {
            overrun.next_row();
        }
        EXPECT_THROWS(std::invalid_argument, overrun.flush());
        EXPECT_EQ(uint64_t, overrun.buffer_row(), 5);
        EXPECT_EQ(uint64_t, overrun.array_offset(), 20);
        // rows stay staged, so the destructor retries and logs the failure
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
