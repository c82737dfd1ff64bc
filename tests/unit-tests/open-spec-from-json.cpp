#include "open.spec.hh"
#include "unit.test.macros.hh"

#include <nlohmann/json.hpp>

namespace {
bool
rejects(const std::string& str)
{
    try {
        (void)fileio::open_spec_from_json(nlohmann::json::parse(str));
    } catch (const std::runtime_error&) {
        return true;
    }

    return false;
}
} // namespace

int
main()
{
    int retval = 0;

    try {
        {
            const auto spec =
              fileio::open_spec_from_json(nlohmann::json::parse(R"({
                "path": "out.bin",
                "flags": ["write", "create"],
                "start_position": 4004
              })"));
            EXPECT_STR_EQ(spec.path.c_str(), "out.bin");
            EXPECT_EQ(uint32_t,
                      spec.flags,
                      FileIOOpenFlag_Write | FileIOOpenFlag_Create);
            CHECK(spec.start_position.has_value());
            EXPECT_EQ(uint64_t, *spec.start_position, 4004);
        }

        {
            const auto spec = fileio::open_spec_from_json(
              nlohmann::json::parse(R"({"path": "out.bin"})"));
            EXPECT_EQ(uint32_t, spec.flags, 0);
            EXPECT_EQ(uint32_t, spec.effective_flags(), fileio::default_open_flags);
            CHECK(!spec.start_position.has_value());
        }

        {
            const auto spec = fileio::open_spec_from_json(
              nlohmann::json::parse(R"({"path": "log.txt", "flags": ["append"]})"));
            CHECK(spec.has(FileIOOpenFlag_Append));
            CHECK(!spec.has(FileIOOpenFlag_Truncate));
        }

        CHECK(rejects(R"([])"));
        CHECK(rejects(R"({"flags": ["write"]})"));
        CHECK(rejects(R"({"path": 42})"));
        CHECK(rejects(R"({"path": "out.bin", "flags": "write"})"));
        CHECK(rejects(R"({"path": "out.bin", "flags": ["sync"]})"));
        CHECK(rejects(R"({"path": "out.bin", "start_position": -1})"));
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
