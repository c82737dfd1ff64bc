#include "fileio.h"
#include "test.macros.hh"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {
const fs::path test_path = fs::temp_directory_path() / TEST;

std::vector<std::string>
make_lines()
{
    std::vector<std::string> lines;
    for (char c = 'a'; c <= 'f'; ++c) {
        lines.push_back(std::string(1000, c) + "\n");
    }
    return lines;
}

std::string
read_file(const fs::path& path)
{
    std::ifstream ifs(path, std::ios::binary);
    CHECK(ifs.is_open());

    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}
} // namespace

int
main()
{
    int retval = 1;

    FileIOSystem* system = FileIOSystem_create(nullptr);
    FileIOSink* sink = nullptr;

    try {
        CHECK(system);
        CHECK(!fs::exists(test_path));

        const std::string path = test_path.string();
        FileIOSinkSettings settings{ .path = path.c_str(),
                                     .open_flags = 0,
                                     .start_position = 0,
                                     .dispatcher = nullptr };
        sink = FileIOSink_create(system, &settings);
        CHECK(sink);

        std::string expected;
        for (const auto& line : make_lines()) {
            CHECK_OK(FileIOSink_write(sink, line.data(), line.size()));
            expected += line;
        }

        FileIOResult result{};
        CHECK_OK(FileIOSink_finish(sink, &result));
        EXPECT_EQ(uint64_t, result.count, 6006);
        CHECK(result.status == FileIOStatusCode_Success);

        // nothing is accepted after the run has finished
        CHECK_STATUS(FileIOSink_write(sink, "x", 1),
                     FileIOStatusCode_StreamClosed);

        EXPECT_EQ(size_t, fs::file_size(test_path), 6006);
        CHECK(read_file(test_path) == expected);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    FileIOSink_destroy(sink);
    FileIOSystem_destroy(system);

    std::error_code ec;
    fs::remove(test_path, ec);

    return retval;
}
