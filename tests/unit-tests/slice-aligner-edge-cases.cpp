#include "slice.aligner.hh"
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
        // an empty dimension has no chunks, hence no slices
        CHECK(pzarr::chunk_aligned_slices(0, 4, 3).empty());

        // capped to the first 2 chunks
        {
            const auto slices = pzarr::chunk_aligned_slices(100, 10, 4, 2);
            EXPECT_EQ(size_t, slices.size(), 2);
            CHECK((slices[0] == pzarr::RowSlice{ 0, 10 }));
            CHECK((slices[1] == pzarr::RowSlice{ 10, 20 }));
        }

        // a cap larger than the number of chunks has no effect
        {
            const auto slices = pzarr::chunk_aligned_slices(25, 10, 1, 100);
            EXPECT_EQ(size_t, slices.size(), 1);
            CHECK((slices[0] == pzarr::RowSlice{ 0, 25 }));
        }

        CHECK(pzarr::chunk_aligned_slices(100, 10, 4, 0).empty());

        EXPECT_THROWS(std::invalid_argument,
                      pzarr::chunk_aligned_slices(10, 0, 2));
        EXPECT_THROWS(std::invalid_argument,
                      pzarr::chunk_aligned_slices(10, 4, 0));

        // slices of an array follow its first dimension
        {
            pzarr::ZarrV2ArrayConfig config{
                .store_path = (base_dir / "array.zarr").string(),
                .dimensions = { { "variants", 10, 4 }, { "samples", 3, 3 } },
                .dtype = PzarrDataType_int32,
            };
            auto array = pzarr::ZarrV2Array::create(config);

            const auto slices = pzarr::chunk_aligned_slices(*array, 2);
            EXPECT_EQ(size_t, slices.size(), 2);
            CHECK((slices[0] == pzarr::RowSlice{ 0, 8 }));
            CHECK((slices[1] == pzarr::RowSlice{ 8, 10 }));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
