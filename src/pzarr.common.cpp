#include "pzarr.common.hh"

#include <algorithm>
#include <bit>
#include <cctype>

namespace {
const std::string dtype_prefix =
  std::endian::native == std::endian::big ? ">" : "<";
} // namespace

std::string
pzarr::trim(std::string_view s)
{
    if (s.empty()) {
        return {};
    }

    // trim left
    std::string trimmed(s);
    trimmed.erase(trimmed.begin(),
                  std::find_if(trimmed.begin(), trimmed.end(), [](char c) {
                      return !std::isspace(static_cast<unsigned char>(c));
                  }));

    // trim right
    trimmed.erase(std::find_if(trimmed.rbegin(),
                               trimmed.rend(),
                               [](char c) {
                                   return !std::isspace(
                                     static_cast<unsigned char>(c));
                               })
                    .base(),
                  trimmed.end());

    return trimmed;
}

bool
pzarr::is_empty_string(std::string_view s, std::string_view err_on_empty)
{
    auto trimmed = trim(s);
    if (trimmed.empty()) {
        LOG_ERROR(err_on_empty);
        return true;
    }
    return false;
}

size_t
pzarr::bytes_of_type(PzarrDataType data_type)
{
    switch (data_type) {
        case PzarrDataType_int8:
        case PzarrDataType_uint8:
            return 1;
        case PzarrDataType_int16:
        case PzarrDataType_uint16:
            return 2;
        case PzarrDataType_int32:
        case PzarrDataType_uint32:
        case PzarrDataType_float32:
            return 4;
        case PzarrDataType_int64:
        case PzarrDataType_uint64:
        case PzarrDataType_float64:
            return 8;
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(data_type));
    }
}

std::string
pzarr::dtype_to_string(PzarrDataType data_type)
{
    switch (data_type) {
        case PzarrDataType_uint8:
            return dtype_prefix + "u1";
        case PzarrDataType_uint16:
            return dtype_prefix + "u2";
        case PzarrDataType_uint32:
            return dtype_prefix + "u4";
        case PzarrDataType_uint64:
            return dtype_prefix + "u8";
        case PzarrDataType_int8:
            return dtype_prefix + "i1";
        case PzarrDataType_int16:
            return dtype_prefix + "i2";
        case PzarrDataType_int32:
            return dtype_prefix + "i4";
        case PzarrDataType_int64:
            return dtype_prefix + "i8";
        case PzarrDataType_float32:
            return dtype_prefix + "f4";
        case PzarrDataType_float64:
            return dtype_prefix + "f8";
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(data_type));
    }
}

PzarrDataType
pzarr::dtype_from_string(std::string_view dtype)
{
    for (auto i = 0; i < PzarrDataTypeCount; ++i) {
        const auto t = static_cast<PzarrDataType>(i);
        const auto candidate = dtype_to_string(t);
        if (candidate == dtype) {
            return t;
        }

        // single-byte types have no meaningful byte order
        if (bytes_of_type(t) == 1 && dtype.size() == 3 &&
            (dtype[0] == '|' || dtype[0] == '<' || dtype[0] == '>') &&
            dtype.substr(1) == std::string_view(candidate).substr(1)) {
            return t;
        }
    }

    throw std::invalid_argument("Unsupported dtype: " + std::string(dtype));
}

uint64_t
pzarr::chunks_along_dimension(uint64_t array_size, uint64_t chunk_size)
{
    EXPECT(chunk_size > 0, "Invalid chunk size.");

    return (array_size + chunk_size - 1) / chunk_size;
}
