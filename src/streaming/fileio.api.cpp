#include "fileio.h"
#include "fileio.sink.hh"
#include "macros.hh"

namespace {
void
copy_result(const fileio::IOResult& from, FileIOResult* to)
{
    if (to == nullptr) {
        return;
    }

    to->count = from.count;
    to->status = to_status_code(from.status);
}
} // namespace

extern "C"
{
    const char* FileIO_get_api_version()
    {
        return FILEIO_API_VERSION;
    }

    FileIOStatusCode FileIO_set_log_level(FileIOLogLevel level_)
    {
        LogLevel level;
        switch (level_) {
            case FileIOLogLevel_Debug:
                level = LogLevel_Debug;
                break;
            case FileIOLogLevel_Info:
                level = LogLevel_Info;
                break;
            case FileIOLogLevel_Warning:
                level = LogLevel_Warning;
                break;
            case FileIOLogLevel_Error:
                level = LogLevel_Error;
                break;
            case FileIOLogLevel_None:
                level = LogLevel_None;
                break;
            default:
                return FileIOStatusCode_InvalidArgument;
        }

        try {
            Logger::set_log_level(level);
        } catch (const std::exception& e) {
            LOG_ERROR("Error setting log level: ", e.what());
            return FileIOStatusCode_InternalError;
        }
        return FileIOStatusCode_Success;
    }

    FileIOLogLevel FileIO_get_log_level()
    {
        FileIOLogLevel level;
        switch (Logger::get_log_level()) {
            case LogLevel_Debug:
                level = FileIOLogLevel_Debug;
                break;
            case LogLevel_Info:
                level = FileIOLogLevel_Info;
                break;
            case LogLevel_Warning:
                level = FileIOLogLevel_Warning;
                break;
            case LogLevel_None:
                level = FileIOLogLevel_None;
                break;
            default:
                level = FileIOLogLevel_Error;
                break;
        }
        return level;
    }

    const char* FileIO_get_status_message(FileIOStatusCode code)
    {
        switch (code) {
            case FileIOStatusCode_Success:
                return "Success";
            case FileIOStatusCode_InvalidArgument:
                return "Invalid argument";
            case FileIOStatusCode_InvalidSettings:
                return "Invalid settings";
            case FileIOStatusCode_InternalError:
                return "Internal error";
            case FileIOStatusCode_OutOfMemory:
                return "Out of memory";
            case FileIOStatusCode_OpenFailure:
                return "Failed to open file";
            case FileIOStatusCode_WriteFailure:
                return "Failed to write file";
            case FileIOStatusCode_Cancelled:
                return "Cancelled";
            case FileIOStatusCode_StreamClosed:
                return "Stream closed";
            default:
                return "Unknown error";
        }
    }

    FileIOSystem* FileIOSystem_create(const char* config_json)
    {
        FileIOSystem_s* system = nullptr;

        try {
            system = new FileIOSystem_s(config_json);
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for I/O system");
        } catch (const std::exception& e) {
            LOG_ERROR("Error creating I/O system: ", e.what());
        }

        return system;
    }

    void FileIOSystem_destroy(FileIOSystem* system)
    {
        delete system;
    }

    FileIOSink* FileIOSink_create(FileIOSystem* system,
                                  const FileIOSinkSettings* settings)
    {
        FileIOSink_s* sink = nullptr;

        try {
            sink = new FileIOSink_s(system, settings);
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for file sink");
        } catch (const std::exception& e) {
            LOG_ERROR("Error creating file sink: ", e.what());
        }

        return sink;
    }

    FileIOStatusCode FileIOSink_write(FileIOSink* sink,
                                      const void* data,
                                      size_t bytes_in)
    {
        EXPECT_VALID_ARGUMENT(sink, "Null pointer: sink");
        EXPECT_VALID_ARGUMENT(data || bytes_in == 0, "Null pointer: data");

        try {
            if (!sink->write(data, bytes_in)) {
                return FileIOStatusCode_StreamClosed;
            }
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for chunk");
            return FileIOStatusCode_OutOfMemory;
        } catch (const std::exception& e) {
            LOG_ERROR("Error writing data: ", e.what());
            return FileIOStatusCode_InternalError;
        }

        return FileIOStatusCode_Success;
    }

    FileIOStatusCode FileIOSink_finish(FileIOSink* sink, FileIOResult* result)
    {
        EXPECT_VALID_ARGUMENT(sink, "Null pointer: sink");

        try {
            const auto io_result = sink->finish();
            copy_result(io_result, result);
            return to_status_code(io_result.status);
        } catch (const std::exception& e) {
            LOG_ERROR("Error finishing sink: ", e.what());
            return FileIOStatusCode_InternalError;
        }
    }

    FileIOStatusCode FileIOSink_cancel(FileIOSink* sink, FileIOResult* result)
    {
        EXPECT_VALID_ARGUMENT(sink, "Null pointer: sink");

        try {
            const auto io_result = sink->cancel();
            copy_result(io_result, result);
            return to_status_code(io_result.status);
        } catch (const std::exception& e) {
            LOG_ERROR("Error cancelling sink: ", e.what());
            return FileIOStatusCode_InternalError;
        }
    }

    void FileIOSink_destroy(FileIOSink* sink)
    {
        delete sink;
    }
}
