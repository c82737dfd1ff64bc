#pragma once

#include "file.sink.hh"
#include "io.result.hh"
#include "open.spec.hh"
#include "subscriber.hh"
#include "thread.pool.hh"

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace fileio {
/**
 * @brief Terminal pipeline stage that persists byte-chunks to a file.
 *
 * @details The stage opens its sink as soon as it is subscribed, then requests
 * one chunk at a time: the next request is only issued once the write of the
 * previous chunk has completed, so at most one open, write or close is ever in
 * flight. All blocking calls run on the execution context given at
 * construction. The outcome of the run is resolved exactly once, after the
 * sink has been closed, and is never thrown.
 *
 * @note The stage must be owned by a std::shared_ptr. Pending jobs keep it
 * alive until they have run.
 */
class FileWriteStage final
  : public Subscriber
  , public std::enable_shared_from_this<FileWriteStage>
{
  public:
    enum class State
    {
        Uninitialized,
        Opening,
        Writing,
        Closing,
        Completed
    };

    using ResultCallback = std::function<void(const IOResult&)>;

    /**
     * @throw std::runtime_error if @p spec is invalid or @p io_context is null.
     */
    FileWriteStage(OpenSpec spec,
                   std::shared_ptr<ThreadPool> io_context,
                   SinkFactory make_sink = make_file_sink);

    void on_subscribe(std::shared_ptr<Upstream> upstream) override;
    void on_push(Chunk&& chunk) override;
    void on_complete() override;
    void on_error(const std::string& reason) override;

    /**
     * @brief Cancel the run from downstream.
     * @details An in-flight write is allowed to finish, then the sink is closed
     * and the result reports the bytes written so far as Cancelled.
     */
    void cancel();

    [[nodiscard]] std::shared_future<IOResult> result() const;

    /**
     * @brief Register a callback to receive the result.
     * @note Called exactly once, immediately if the run has already completed.
     */
    void on_result(ResultCallback&& callback);

    [[nodiscard]] State state() const;
    [[nodiscard]] uint64_t bytes_written() const;
    [[nodiscard]] const OpenSpec& spec() const noexcept;
    [[nodiscard]] const ThreadPool& io_context() const noexcept;

  private:
    struct Termination
    {
        IOStatus status;
        std::string cause;
    };

    const OpenSpec spec_;
    const std::shared_ptr<ThreadPool> io_context_;
    const SinkFactory make_sink_;

    mutable std::mutex mutex_;
    State state_;
    std::shared_ptr<Upstream> upstream_;
    std::unique_ptr<Sink> sink_;
    bool demand_outstanding_;
    bool io_in_flight_;
    std::optional<Termination> termination_;
    uint64_t bytes_written_;

    std::promise<IOResult> promise_;
    std::shared_future<IOResult> future_;
    std::optional<IOResult> result_;
    std::vector<ResultCallback> callbacks_;

    /** @brief Runs on the execution context. */
    void open_();

    /** @brief Runs on the execution context. */
    void write_(Chunk&& chunk);

    /** @brief Runs on the execution context. */
    void close_();

    /** @brief Record the first terminal signal and close if idle. */
    void terminate_(IOStatus status, std::string cause, bool cancel_upstream);

    /**
     * @brief Tear down on the calling thread when the execution context can
     * no longer run our jobs.
     */
    void abort_(IOStatus status, const std::string& cause);

    [[nodiscard]] bool dispatch_(std::function<void()>&& job);
    void complete_(IOResult&& result);
};

const char*
to_string(FileWriteStage::State state);
} // namespace fileio
