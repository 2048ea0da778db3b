#include "blosc.compression.params.hh"

const char*
pzarr::blosc_codec_to_string(PzarrCompressionCodec codec)
{
    switch (codec) {
        case PzarrCompressionCodec_BloscZstd:
            return "zstd";
        case PzarrCompressionCodec_BloscLZ4:
            return "lz4";
        default:
            return "unrecognized codec";
    }
}

pzarr::BloscCompressionParams::BloscCompressionParams(std::string_view codec_id,
                                                      uint8_t clevel,
                                                      uint8_t shuffle)
  : codec_id{ codec_id }
  , clevel{ clevel }
  , shuffle{ shuffle }
{
}
