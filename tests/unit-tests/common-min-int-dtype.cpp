#include "pzarr.common.hh"
#include "unit.test.macros.hh"

#include <cstdint>
#include <limits>
#include <stdexcept>

int
main()
{
    int retval = 0;

    try {
        EXPECT_EQ(int, pzarr::min_int_dtype(0, 0), PzarrDataType_int8);
        EXPECT_EQ(int, pzarr::min_int_dtype(-128, 127), PzarrDataType_int8);
        EXPECT_EQ(int, pzarr::min_int_dtype(0, 128), PzarrDataType_int16);
        EXPECT_EQ(int, pzarr::min_int_dtype(0, 200), PzarrDataType_int16);
        EXPECT_EQ(int, pzarr::min_int_dtype(-129, 0), PzarrDataType_int16);
        EXPECT_EQ(int, pzarr::min_int_dtype(-1, 40000), PzarrDataType_int32);
        EXPECT_EQ(int,
                  pzarr::min_int_dtype<int64_t>(0, int64_t{ 1 } << 40),
                  PzarrDataType_int64);
        EXPECT_EQ(int,
                  pzarr::min_int_dtype(std::numeric_limits<int64_t>::min(),
                                       std::numeric_limits<int64_t>::max()),
                  PzarrDataType_int64);

        // unsigned bounds are compared by value, not by representation
        EXPECT_EQ(int,
                  pzarr::min_int_dtype<uint64_t>(0, 255),
                  PzarrDataType_int16);

        EXPECT_THROWS(std::invalid_argument, pzarr::min_int_dtype(5, 3));
        EXPECT_THROWS(
          std::overflow_error,
          pzarr::min_int_dtype<uint64_t>(
            0, std::numeric_limits<uint64_t>::max()));
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
