#include "io.system.hh"
#include "lazy.sink.hh"
#include "unit.test.macros.hh"
#include "unit.test.probes.hh"

#include <filesystem>

namespace fs = std::filesystem;

int
main()
{
    int retval = 0;
    fs::path tmp_path = fs::temp_directory_path() / TEST;

    try {
        CHECK(!fs::exists(tmp_path));
        fileio::IOSystem system;

        int stages_created = 0;
        auto make_stage = [&] {
            ++stages_created;
            return system.to_path({ .path = tmp_path.string() });
        };

        // an empty upstream resolves to the fallback without creating a sink
        {
            auto source = system.source({});
            auto lazy = std::make_shared<fileio::LazySink>(
              make_stage,
              fileio::IOResult::failure(
                0, fileio::IOStatus::Cancelled, "nothing to write"));

            source->subscribe(lazy);
            const auto result = lazy->result().get();
            CHECK(result.status == fileio::IOStatus::Cancelled);
            EXPECT_STR_EQ(result.error.c_str(), "nothing to write");
            CHECK(!lazy->stage());
        }

        // an upstream failure before the first chunk
        {
            auto upstream = std::make_shared<fileio::test::ManualUpstream>();
            auto lazy = std::make_shared<fileio::LazySink>(
              make_stage, fileio::IOResult::success(0));

            lazy->on_subscribe(upstream);
            EXPECT_EQ(size_t, upstream->requests(), 1);

            lazy->on_error("boom");
            const auto result = lazy->result().get();
            CHECK(result.status == fileio::IOStatus::Cancelled);
            EXPECT_STR_EQ(result.error.c_str(), "Upstream failed: boom");
        }

        // cancelled before the first chunk
        {
            auto upstream = std::make_shared<fileio::test::ManualUpstream>();
            auto lazy = std::make_shared<fileio::LazySink>(
              make_stage, fileio::IOResult::success(0));

            lazy->on_subscribe(upstream);
            lazy->cancel();
            const auto result = lazy->result().get();
            CHECK(result.status == fileio::IOStatus::Cancelled);
            CHECK(upstream->cancelled());

            // chunks arriving afterwards are dropped
            lazy->on_push(fileio::test::make_chunk('x', 10));
            CHECK(!lazy->stage());
        }

        EXPECT_EQ(int, stages_created, 0);
        CHECK(!fs::exists(tmp_path));
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
