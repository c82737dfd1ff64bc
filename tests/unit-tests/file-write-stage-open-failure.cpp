#include "file.write.stage.hh"
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
        auto pool = std::make_shared<fileio::ThreadPool>(
          "io-pool", 1, [](const std::string&) {});

        // missing file without the create flag
        {
            auto upstream = std::make_shared<fileio::test::ManualUpstream>();
            auto stage = std::make_shared<fileio::FileWriteStage>(
              fileio::OpenSpec{ .path = tmp_path.string(),
                                .flags = FileIOOpenFlag_Write },
              pool);

            stage->on_subscribe(upstream);
            const auto result = stage->result().get();

            CHECK(result.status == fileio::IOStatus::OpenFailure);
            EXPECT_EQ(uint64_t, result.count, 0);
            CHECK(!result.error.empty());
            CHECK(upstream->cancelled());
            EXPECT_EQ(size_t, upstream->requests(), 0);
            CHECK(stage->state() == fileio::FileWriteStage::State::Completed);
            CHECK(!fs::exists(tmp_path));
        }

        // missing parent directory
        {
            auto upstream = std::make_shared<fileio::test::ManualUpstream>();
            auto stage = std::make_shared<fileio::FileWriteStage>(
              fileio::OpenSpec{ .path = (tmp_path / "out.bin").string() },
              pool);

            stage->on_subscribe(upstream);
            const auto result = stage->result().get();
            CHECK(result.status == fileio::IOStatus::OpenFailure);
            CHECK(upstream->cancelled());
        }

        // a factory that produces nothing
        {
            auto upstream = std::make_shared<fileio::test::ManualUpstream>();
            auto stage = std::make_shared<fileio::FileWriteStage>(
              fileio::OpenSpec{ .path = tmp_path.string() },
              pool,
              [](const fileio::OpenSpec&) -> std::unique_ptr<fileio::Sink> {
                  return nullptr;
              });

            stage->on_subscribe(upstream);
            const auto result = stage->result().get();
            CHECK(result.status == fileio::IOStatus::OpenFailure);
            EXPECT_EQ(uint64_t, result.count, 0);
        }

        // an invalid spec is rejected at construction
        bool threw = false;
        try {
            auto stage = std::make_shared<fileio::FileWriteStage>(
              fileio::OpenSpec{ .path = tmp_path.string(),
                                .flags = FileIOOpenFlag_Append,
                                .start_position = 5 },
              pool);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        CHECK(threw);

        // so is a missing execution context
        threw = false;
        try {
            auto stage = std::make_shared<fileio::FileWriteStage>(
              fileio::OpenSpec{ .path = tmp_path.string() }, nullptr);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        CHECK(threw);

        // a stopped execution context fails the run without blocking
        {
            pool->await_stop();

            auto upstream = std::make_shared<fileio::test::ManualUpstream>();
            auto stage = std::make_shared<fileio::FileWriteStage>(
              fileio::OpenSpec{ .path = tmp_path.string() }, pool);

            stage->on_subscribe(upstream);
            const auto result = stage->result().get();
            CHECK(result.status == fileio::IOStatus::Cancelled);
            CHECK(upstream->cancelled());
            CHECK(!fs::exists(tmp_path));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
