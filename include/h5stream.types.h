#ifndef H_H5STREAM_TYPES_V0
#define H_H5STREAM_TYPES_V0

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        H5StreamStatusCode_Success = 0,
        H5StreamStatusCode_InvalidArgument,
        H5StreamStatusCode_Overflow,
        H5StreamStatusCode_InvalidIndex,
        H5StreamStatusCode_NotYetImplemented,
        H5StreamStatusCode_InternalError,
        H5StreamStatusCode_OutOfMemory,
        H5StreamStatusCode_IOError,
        H5StreamStatusCode_CompressionError,
        H5StreamStatusCode_InvalidSettings,
        H5StreamStatusCodeCount,
    } H5StreamStatusCode;

    typedef enum
    {
        H5StreamLogLevel_Debug,
        H5StreamLogLevel_Info,
        H5StreamLogLevel_Warning,
        H5StreamLogLevel_Error,
        H5StreamLogLevel_None,
        H5StreamLogLevelCount
    } H5StreamLogLevel;

    typedef enum
    {
        H5StreamDataType_uint8,
        H5StreamDataType_uint16,
        H5StreamDataType_uint32,
        H5StreamDataType_uint64,
        H5StreamDataType_int8,
        H5StreamDataType_int16,
        H5StreamDataType_int32,
        H5StreamDataType_int64,
        H5StreamDataType_float32,
        H5StreamDataType_float64,
        H5StreamDataTypeCount
    } H5StreamDataType;

    /**
     * @brief A single detector frame as delivered by the transport.
     * @details The payload is written to storage verbatim. If the dataset is
     * configured with a compression filter, @p data must already be encoded in
     * that filter's on-disk form.
     */
    typedef struct
    {
        int64_t frame_index;    /**< Global, 0-based frame index */
        uint32_t rows;          /**< Frame height in pixels */
        uint32_t cols;          /**< Frame width in pixels */
        H5StreamDataType dtype; /**< Pixel type */
        const void* data;       /**< Pre-encoded payload */
        size_t bytes_of_data;   /**< Bytes in @p data */
    } H5StreamFrame;

#ifdef __cplusplus
}
#endif

#endif // H_H5STREAM_TYPES_V0
