/// @file
/// @brief Write a few lines of text to a file, then append a few more. The
/// path and an optional JSON configuration for the dispatchers are taken from
/// the command line.

#include "fileio.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

namespace {
std::string
read_config(const char* path)
{
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        fprintf(stderr, "Failed to open config file %s\n", path);
        return {};
    }

    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

int
write_lines(FileIOSystem* system,
            const char* path,
            uint32_t open_flags,
            char first,
            char last)
{
    FileIOSinkSettings settings{
        .path = path,
        .open_flags = open_flags,
        .start_position = 0,
        .dispatcher = nullptr,
    };

    FileIOSink* sink = FileIOSink_create(system, &settings);
    if (!sink) {
        fprintf(stderr, "Failed to create sink for %s\n", path);
        return 1;
    }

    for (char c = first; c <= last; ++c) {
        const std::string line = std::string(72, c) + "\n";
        const FileIOStatusCode status =
          FileIOSink_write(sink, line.data(), line.size());
        if (status != FileIOStatusCode_Success) {
            // the run has stopped; finish reports why
            fprintf(stderr, "Write refused: %s\n", FileIO_get_status_message(status));
            break;
        }
    }

    FileIOResult result{};
    const FileIOStatusCode status = FileIOSink_finish(sink, &result);
    FileIOSink_destroy(sink);

    printf("%s: wrote %llu bytes (%s)\n",
           path,
           static_cast<unsigned long long>(result.count),
           FileIO_get_status_message(result.status));

    return status == FileIOStatusCode_Success ? 0 : 1;
}
} // namespace

int
main(int argc, char* argv[])
{
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <output path> [config.json]\n", argv[0]);
        return 1;
    }

    FileIO_set_log_level(FileIOLogLevel_Info);

    const std::string config = argc > 2 ? read_config(argv[2]) : std::string{};
    FileIOSystem* system = FileIOSystem_create(config.c_str());
    if (!system) {
        fprintf(stderr, "Failed to create I/O system\n");
        return 1;
    }

    int retval = write_lines(system, argv[1], 0, 'a', 'f');
    if (retval == 0) {
        retval = write_lines(system,
                             argv[1],
                             FileIOOpenFlag_Append | FileIOOpenFlag_Write,
                             'x',
                             'z');
    }

    FileIOSystem_destroy(system);

    return retval;
}
