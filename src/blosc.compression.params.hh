#pragma once

#include "pzarr.types.h"

#include <blosc.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace pzarr {
const char*
blosc_codec_to_string(PzarrCompressionCodec codec);

struct BloscCompressionParams
{
    std::string codec_id;
    uint8_t clevel{ 1 };
    uint8_t shuffle{ 1 };

    BloscCompressionParams() = default;
    BloscCompressionParams(std::string_view codec_id,
                           uint8_t clevel,
                           uint8_t shuffle);
};
} // namespace pzarr
