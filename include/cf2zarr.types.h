#ifndef H_CF2ZARR_TYPES_V0
#define H_CF2ZARR_TYPES_V0

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        Cf2ZarrStatusCode_Success = 0,
        Cf2ZarrStatusCode_InvalidArgument,
        Cf2ZarrStatusCode_SelectionError,
        Cf2ZarrStatusCode_AxisMismatch,
        Cf2ZarrStatusCode_NoOrderingCoordinate,
        Cf2ZarrStatusCode_NoMatch,
        Cf2ZarrStatusCode_WriteConflict,
        Cf2ZarrStatusCode_IOError,
        Cf2ZarrStatusCode_CompressionError,
        Cf2ZarrStatusCode_StorageFormatError,
        Cf2ZarrStatusCode_StagingError,
        Cf2ZarrStatusCode_InvalidSettings,
        Cf2ZarrStatusCode_NotYetImplemented,
        Cf2ZarrStatusCode_InternalError,
        Cf2ZarrStatusCodeCount,
    } Cf2ZarrStatusCode;

    typedef enum
    {
        Cf2ZarrLogLevel_Debug,
        Cf2ZarrLogLevel_Info,
        Cf2ZarrLogLevel_Warning,
        Cf2ZarrLogLevel_Error,
        Cf2ZarrLogLevel_None,
        Cf2ZarrLogLevelCount
    } Cf2ZarrLogLevel;

    typedef enum
    {
        Cf2ZarrDataType_uint8,
        Cf2ZarrDataType_uint16,
        Cf2ZarrDataType_uint32,
        Cf2ZarrDataType_uint64,
        Cf2ZarrDataType_int8,
        Cf2ZarrDataType_int16,
        Cf2ZarrDataType_int32,
        Cf2ZarrDataType_int64,
        Cf2ZarrDataType_float32,
        Cf2ZarrDataType_float64,
        Cf2ZarrDataTypeCount
    } Cf2ZarrDataType;

    typedef enum
    {
        Cf2ZarrCompressionCodec_BloscLZ = 0,
        Cf2ZarrCompressionCodec_BloscLZ4,
        Cf2ZarrCompressionCodec_BloscLZ4HC,
        Cf2ZarrCompressionCodec_BloscZlib,
        Cf2ZarrCompressionCodec_BloscZstd,
        Cf2ZarrCompressionCodecCount
    } Cf2ZarrCompressionCodec;

    typedef enum
    {
        Cf2ZarrCreateMode_Exclusive = 0,
        Cf2ZarrCreateMode_Overwrite,
        Cf2ZarrCreateModeCount
    } Cf2ZarrCreateMode;

    /**
     * @brief S3 settings for staging remote inputs.
     */
    typedef struct
    {
        const char* endpoint;
        const char* access_key_id;
        const char* secret_access_key;
    } Cf2ZarrS3Settings;

    /**
     * @brief Compression settings applied to every stored array.
     */
    typedef struct
    {
        Cf2ZarrCompressionCodec codec; /**< Blosc codec to use */
        uint8_t level;                 /**< Compression level, 0-9 */
        uint8_t shuffle; /**< Whether to shuffle the data before compressing */
    } Cf2ZarrCompressionSettings;

#ifdef __cplusplus
}
#endif

#endif // H_CF2ZARR_TYPES_V0
