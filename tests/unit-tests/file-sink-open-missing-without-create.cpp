#include "file.sink.hh"
#include "unit.test.macros.hh"

#include <filesystem>

namespace fs = std::filesystem;

int
main()
{
    int retval = 0;
    fs::path tmp_path = fs::temp_directory_path() / TEST;

    try {
        CHECK(!fs::exists(tmp_path));

        bool threw = false;
        try {
            fileio::FileSink sink(
              { .path = tmp_path.string(), .flags = FileIOOpenFlag_Write });
        } catch (const std::runtime_error& e) {
            LOG_DEBUG("Expected failure: ", e.what());
            threw = true;
        }
        CHECK(threw);
        CHECK(!fs::exists(tmp_path));

        // a missing parent directory fails even with create
        threw = false;
        try {
            fileio::FileSink sink({ .path = (tmp_path / "nested").string() });
        } catch (const std::runtime_error& e) {
            LOG_DEBUG("Expected failure: ", e.what());
            threw = true;
        }
        CHECK(threw);

        // the default factory surfaces the same failure
        threw = false;
        try {
            (void)fileio::make_file_sink(
              { .path = tmp_path.string(), .flags = FileIOOpenFlag_Append });
        } catch (const std::runtime_error& e) {
            LOG_DEBUG("Expected failure: ", e.what());
            threw = true;
        }
        CHECK(threw);
        CHECK(!fs::exists(tmp_path));
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
