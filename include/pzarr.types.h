#ifndef H_PZARR_TYPES_V0
#define H_PZARR_TYPES_V0

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        PzarrLogLevel_Debug,
        PzarrLogLevel_Info,
        PzarrLogLevel_Warning,
        PzarrLogLevel_Error,
        PzarrLogLevel_None,
        PzarrLogLevelCount
    } PzarrLogLevel;

    typedef enum
    {
        PzarrDataType_uint8,
        PzarrDataType_uint16,
        PzarrDataType_uint32,
        PzarrDataType_uint64,
        PzarrDataType_int8,
        PzarrDataType_int16,
        PzarrDataType_int32,
        PzarrDataType_int64,
        PzarrDataType_float32,
        PzarrDataType_float64,
        PzarrDataTypeCount
    } PzarrDataType;

    typedef enum
    {
        PzarrCompressionCodec_None = 0,
        PzarrCompressionCodec_BloscLZ4,
        PzarrCompressionCodec_BloscZstd,
        PzarrCompressionCodecCount
    } PzarrCompressionCodec;

#ifdef __cplusplus
}
#endif

#endif // H_PZARR_TYPES_V0
