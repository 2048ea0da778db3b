#pragma once

#include "macros.hh"
#include "pzarr.types.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace pzarr {
/**
 * @brief Trim whitespace from a string.
 * @param s The string to trim.
 * @return The string with leading and trailing whitespace removed.
 */
[[nodiscard]]
std::string
trim(std::string_view s);

/**
 * @brief Check if a string is empty, including whitespace.
 * @param s The string to check.
 * @param err_on_empty The message to log if the string is empty.
 * @return True if the string is empty, false otherwise.
 */
bool
is_empty_string(std::string_view s, std::string_view err_on_empty);

/**
 * @brief Get the number of bytes for a given data type.
 * @param data_type The data type.
 * @return The number of bytes for the data type.
 * @throw std::invalid_argument if the data type is not recognized.
 */
size_t
bytes_of_type(PzarrDataType data_type);

/**
 * @brief Get the Zarr v2 dtype string, e.g. "<u2", for a data type.
 * @throw std::invalid_argument if the data type is not recognized.
 */
std::string
dtype_to_string(PzarrDataType data_type);

/**
 * @brief Parse a Zarr v2 dtype string into a data type.
 * @throw std::invalid_argument if the string is not a supported dtype, or
 * has the wrong byte order for this machine.
 */
PzarrDataType
dtype_from_string(std::string_view dtype);

/**
 * @brief Get the number of, possibly ragged, chunks along a dimension.
 * @throw std::runtime_error if the chunk size is zero.
 */
uint64_t
chunks_along_dimension(uint64_t array_size, uint64_t chunk_size);

/**
 * @brief Find the narrowest signed integer type holding every value in
 * [@p min_value, @p max_value].
 * @throw std::invalid_argument if @p min_value > @p max_value.
 * @throw std::overflow_error if no 64-bit or narrower signed type can hold
 * the range.
 */
template<typename T>
PzarrDataType
min_int_dtype(T min_value, T max_value)
{
    static_assert(std::is_integral_v<T>, "Integral bounds required");

    EXPECT_VALID_ARGUMENT(std::cmp_less_equal(min_value, max_value),
                          "min_value must be <= max_value, got ",
                          min_value,
                          " > ",
                          max_value);

    if (std::in_range<int8_t>(min_value) && std::in_range<int8_t>(max_value)) {
        return PzarrDataType_int8;
    }
    if (std::in_range<int16_t>(min_value) &&
        std::in_range<int16_t>(max_value)) {
        return PzarrDataType_int16;
    }
    if (std::in_range<int32_t>(min_value) &&
        std::in_range<int32_t>(max_value)) {
        return PzarrDataType_int32;
    }
    if (std::in_range<int64_t>(min_value) &&
        std::in_range<int64_t>(max_value)) {
        return PzarrDataType_int64;
    }

    throw std::overflow_error("Integer cannot be represented");
}
} // namespace pzarr
