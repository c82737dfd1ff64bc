#ifndef H_FILEIO_TYPES_V0
#define H_FILEIO_TYPES_V0

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        FileIOStatusCode_Success = 0,
        FileIOStatusCode_InvalidArgument,
        FileIOStatusCode_InvalidSettings,
        FileIOStatusCode_InternalError,
        FileIOStatusCode_OutOfMemory,
        FileIOStatusCode_OpenFailure,
        FileIOStatusCode_WriteFailure,
        FileIOStatusCode_Cancelled,
        FileIOStatusCode_StreamClosed,
        FileIOStatusCodeCount,
    } FileIOStatusCode;

    typedef enum
    {
        FileIOLogLevel_Debug,
        FileIOLogLevel_Info,
        FileIOLogLevel_Warning,
        FileIOLogLevel_Error,
        FileIOLogLevel_None,
        FileIOLogLevelCount
    } FileIOLogLevel;

    /**
     * @brief Flags controlling how the target file is opened.
     * @note Combine with bitwise OR. Passing 0 selects the default,
     * FileIOOpenFlag_Create | FileIOOpenFlag_Truncate | FileIOOpenFlag_Write.
     */
    typedef enum
    {
        FileIOOpenFlag_Create = 1 << 0,   /**< Create the file if missing. */
        FileIOOpenFlag_Truncate = 1 << 1, /**< Truncate the file to zero. */
        FileIOOpenFlag_Append = 1 << 2,   /**< Write at end of file. */
        FileIOOpenFlag_Write = 1 << 3,    /**< Open for writing. */
        FileIOOpenFlagMask = (1 << 4) - 1
    } FileIOOpenFlag;

    /**
     * @brief The outcome of a single write run.
     */
    typedef struct
    {
        uint64_t count; /**< Bytes successfully written, also on failure. */
        FileIOStatusCode status; /**< Success, OpenFailure, WriteFailure or
                                      Cancelled. */
    } FileIOResult;

#ifdef __cplusplus
}
#endif

#endif // H_FILEIO_TYPES_V0
