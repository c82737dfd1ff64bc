#include "file.write.stage.hh"
#include "io.system.hh"
#include "unit.test.macros.hh"
#include "unit.test.probes.hh"

#include <filesystem>
#include <mutex>
#include <set>

namespace fs = std::filesystem;

namespace {
/// Records which dispatcher runs each blocking call.
class DispatcherProbe final : public fileio::Sink
{
  public:
    DispatcherProbe(std::unique_ptr<fileio::Sink> inner,
                    std::set<std::string>& names,
                    std::mutex& mutex)
      : inner_{ std::move(inner) }
      , names_{ names }
      , mutex_{ mutex }
    {
        record_();
    }

    bool write(std::span<const std::byte> data) override
    {
        record_();
        const bool ok = inner_->write(data);
        bytes_written_ = inner_->bytes_written();
        return ok;
    }

    bool close() override
    {
        record_();
        return inner_->close();
    }

    bool is_open() const noexcept override { return inner_->is_open(); }

  private:
    std::unique_ptr<fileio::Sink> inner_;
    std::set<std::string>& names_;
    std::mutex& mutex_;

    void record_()
    {
        const auto* pool = fileio::ThreadPool::current();
        std::scoped_lock lock(mutex_);
        names_.insert(pool ? pool->name() : "(none)");
    }
};
} // namespace

int
main()
{
    int retval = 0;
    fs::path tmp_path = fs::temp_directory_path() / TEST;

    try {
        auto settings = fileio::IOSystemSettings::from_json(
          R"({"dispatchers": {"custom-dispatcher": {"threads": 1}}})");
        fileio::IOSystem system(std::move(settings));

        std::set<std::string> names;
        std::mutex mutex;

        auto source = system.source({ fileio::test::make_chunk('x', 1001),
                                      fileio::test::make_chunk('y', 1001) });
        auto stage = system.to_path(
          { .path = tmp_path.string() },
          { .dispatcher = "custom-dispatcher" },
          [&names, &mutex](const fileio::OpenSpec& spec) {
              return std::make_unique<DispatcherProbe>(
                fileio::make_file_sink(spec), names, mutex);
          });
        EXPECT_STR_EQ(stage->io_context().name().c_str(), "custom-dispatcher");

        source->subscribe(stage);
        const auto result = stage->result().get();
        CHECK(result.was_successful());
        EXPECT_EQ(uint64_t, result.count, 2002);

        // the stage attribute moved every blocking call
        std::scoped_lock lock(mutex);
        EXPECT_EQ(size_t, names.size(), 1);
        EXPECT_STR_EQ(names.begin()->c_str(), "custom-dispatcher");
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    std::error_code ec;
    if (!fs::remove(tmp_path, ec)) {
        LOG_ERROR("Failed to remove file: ", ec.message());
        retval = 1;
    }

    return retval;
}
