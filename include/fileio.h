#pragma once

#include "fileio.types.h"

#define FILEIO_API_VERSION "0.1.0"

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * @brief The settings for a file sink.
     * @details The path is the target file. The open flags are a bitwise OR
     * of FileIOOpenFlag values, or 0 for the default create + truncate +
     * write behavior. The start position is the byte offset of the first
     * write; it must be 0 when appending.
     * @note The dispatcher names the execution context that performs the
     * blocking open, write and close calls. Pass NULL to use the system's
     * default blocking I/O dispatcher.
     */
    typedef struct FileIOSinkSettings_s
    {
        const char* path;        /**< Path to the target file. */
        uint32_t open_flags;     /**< Bitwise OR of FileIOOpenFlag values. */
        uint64_t start_position; /**< Offset of the first write. */
        const char* dispatcher;  /**< Optional dispatcher name. */
    } FileIOSinkSettings;

    typedef struct FileIOSystem_s FileIOSystem;
    typedef struct FileIOSink_s FileIOSink;

    /**
     * @brief Get the version of the FileIO API.
     * @return The version of the FileIO API.
     */
    const char* FileIO_get_api_version();

    /**
     * @brief Set the log level for the FileIO API.
     * @param level The log level.
     * @return FileIOStatusCode_Success on success, or an error code on failure.
     */
    FileIOStatusCode FileIO_set_log_level(FileIOLogLevel level);

    /**
     * @brief Get the log level for the FileIO API.
     * @return The log level for the FileIO API.
     */
    FileIOLogLevel FileIO_get_log_level();

    /**
     * @brief Get the message for the given status code.
     * @param status The status code.
     * @return A human-readable status message.
     */
    const char* FileIO_get_status_message(FileIOStatusCode status);

    /**
     * @brief Create the dispatchers shared by all sinks.
     * @param config_json Optional JSON configuration. NULL or empty selects
     * the defaults.
     * @return A pointer to the system, or NULL on failure.
     */
    FileIOSystem* FileIOSystem_create(const char* config_json);

    /**
     * @brief Shut down the dispatchers and free the system.
     * @note All sinks created from @p system must be destroyed first.
     * @param system The system to destroy.
     */
    void FileIOSystem_destroy(FileIOSystem* system);

    /**
     * @brief Create a file sink and start opening its target file.
     * @param system The system providing the dispatchers.
     * @param settings The settings for the sink.
     * @return A pointer to the sink, or NULL if the settings are invalid.
     */
    FileIOSink* FileIOSink_create(FileIOSystem* system,
                                  const FileIOSinkSettings* settings);

    /**
     * @brief Write a chunk of bytes to the sink.
     * @details Blocks until the sink is ready to accept the chunk, i.e., until
     * the file is open and the previous chunk has been written.
     * @param sink The sink.
     * @param data The bytes to write.
     * @param bytes_in The number of bytes in @p data.
     * @return FileIOStatusCode_Success if the chunk was accepted,
     * FileIOStatusCode_StreamClosed if the run has already terminated (call
     * FileIOSink_finish to get the cause), or an error code.
     */
    FileIOStatusCode FileIOSink_write(FileIOSink* sink,
                                      const void* data,
                                      size_t bytes_in);

    /**
     * @brief Signal that no more chunks follow and wait for the result.
     * @param sink The sink.
     * @param[out] result The outcome of the run.
     * @return The status of the run.
     */
    FileIOStatusCode FileIOSink_finish(FileIOSink* sink, FileIOResult* result);

    /**
     * @brief Cancel the run and wait for the file to be closed.
     * @param sink The sink.
     * @param[out] result The outcome of the run. May be NULL.
     * @return The status of the run.
     */
    FileIOStatusCode FileIOSink_cancel(FileIOSink* sink, FileIOResult* result);

    /**
     * @brief Destroy a sink, cancelling its run if it has not finished.
     * @param sink The sink to destroy.
     */
    void FileIOSink_destroy(FileIOSink* sink);

#ifdef __cplusplus
}
#endif
