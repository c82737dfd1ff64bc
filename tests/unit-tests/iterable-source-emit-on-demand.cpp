#include "iterable.source.hh"
#include "unit.test.macros.hh"

#include <condition_variable>
#include <mutex>
#include <vector>

namespace {
class Recorder final : public fileio::Subscriber
{
  public:
    void on_subscribe(std::shared_ptr<fileio::Upstream> upstream) override
    {
        std::scoped_lock lock(mutex_);
        upstream_ = std::move(upstream);
    }

    void on_push(fileio::Chunk&& chunk) override
    {
        std::scoped_lock lock(mutex_);
        chunks_.push_back(std::move(chunk));
        cv_.notify_all();
    }

    void on_complete() override
    {
        std::scoped_lock lock(mutex_);
        completed_ = true;
        cv_.notify_all();
    }

    void on_error(const std::string& reason) override
    {
        std::scoped_lock lock(mutex_);
        error_ = reason;
        cv_.notify_all();
    }

    void request()
    {
        std::shared_ptr<fileio::Upstream> upstream;
        {
            std::scoped_lock lock(mutex_);
            upstream = upstream_;
        }
        upstream->request();
    }

    size_t wait_for_chunks(size_t n)
    {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [&] {
            return chunks_.size() >= n || completed_ || !error_.empty();
        });
        return chunks_.size();
    }

    bool wait_for_end()
    {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [&] { return completed_ || !error_.empty(); });
        return completed_;
    }

    std::vector<fileio::Chunk> chunks()
    {
        std::scoped_lock lock(mutex_);
        return chunks_;
    }

    std::string error()
    {
        std::scoped_lock lock(mutex_);
        return error_;
    }

  private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<fileio::Upstream> upstream_;
    std::vector<fileio::Chunk> chunks_;
    bool completed_{ false };
    std::string error_;
};

fileio::Chunk
make_chunk(char c, size_t n)
{
    return fileio::Chunk(n, static_cast<std::byte>(c));
}
} // namespace

int
main()
{
    int retval = 0;

    try {
        auto pool = std::make_shared<fileio::ThreadPool>(
          "source-pool", 2, [](const std::string& err) {
              LOG_DEBUG("Job failed: ", err);
          });

        // nothing is emitted without demand
        {
            auto source = fileio::IterableSource::from_chunks(
              { make_chunk('a', 3), make_chunk('b', 5) }, pool);
            auto recorder = std::make_shared<Recorder>();
            source->subscribe(recorder);
            EXPECT_EQ(size_t, source->chunks_emitted(), 0);

            recorder->request();
            EXPECT_EQ(size_t, recorder->wait_for_chunks(1), 1);

            recorder->request();
            EXPECT_EQ(size_t, recorder->wait_for_chunks(2), 2);

            // completion follows the request after the last chunk
            recorder->request();
            CHECK(recorder->wait_for_end());

            const auto chunks = recorder->chunks();
            EXPECT_EQ(size_t, chunks.size(), 2);
            EXPECT_EQ(size_t, chunks[0].size(), 3);
            EXPECT_EQ(size_t, chunks[1].size(), 5);
            CHECK(chunks[1][0] == std::byte{ 'b' });
            EXPECT_EQ(size_t, source->chunks_emitted(), 2);

            // a source can only be subscribed once
            bool threw = false;
            try {
                source->subscribe(std::make_shared<Recorder>());
            } catch (const std::runtime_error&) {
                threw = true;
            }
            CHECK(threw);
        }

        // a throwing generator fails the stream
        {
            auto source = std::make_shared<fileio::IterableSource>(
              []() -> std::optional<fileio::Chunk> {
                  throw std::runtime_error("boom");
              },
              pool);
            auto recorder = std::make_shared<Recorder>();
            source->subscribe(recorder);

            recorder->request();
            CHECK(!recorder->wait_for_end());
            CHECK(recorder->error().find("boom") != std::string::npos);
        }

        // nothing is emitted after cancellation
        {
            auto source = fileio::IterableSource::from_chunks(
              { make_chunk('a', 1) }, pool);
            auto recorder = std::make_shared<Recorder>();
            source->subscribe(recorder);

            source->cancel();
            CHECK(source->is_cancelled());
            recorder->request();
            pool->await_stop();

            EXPECT_EQ(size_t, recorder->chunks().size(), 0);
            EXPECT_EQ(size_t, source->chunks_emitted(), 0);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
