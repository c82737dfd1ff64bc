#pragma once

#include "file.write.stage.hh"

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

namespace fileio {
/**
 * @brief Defers building a FileWriteStage until the first chunk arrives.
 *
 * @details The first chunk is held until the new stage signals demand for it.
 * An upstream completion or failure that arrives before the held chunk was
 * handed over is delivered right after it. The result of this sink is the
 * result of the inner stage, or @p fallback if upstream completes without
 * emitting anything.
 */
class LazySink final
  : public Subscriber
  , public std::enable_shared_from_this<LazySink>
{
  public:
    using StageFactory = std::function<std::shared_ptr<FileWriteStage>()>;

    LazySink(StageFactory&& make_stage, IOResult fallback);

    void on_subscribe(std::shared_ptr<Upstream> upstream) override;
    void on_push(Chunk&& chunk) override;
    void on_complete() override;
    void on_error(const std::string& reason) override;

    void cancel();

    [[nodiscard]] std::shared_future<IOResult> result() const;

    /** @brief The inner stage, once it has been built. */
    [[nodiscard]] std::shared_ptr<FileWriteStage> stage() const;

  private:
    class Relay;

    StageFactory make_stage_;
    const IOResult fallback_;

    mutable std::mutex mutex_;
    std::shared_ptr<Upstream> upstream_;
    std::shared_ptr<FileWriteStage> stage_;
    std::optional<Chunk> held_;
    bool upstream_finished_;
    std::optional<std::string> upstream_failure_;
    bool end_delivered_;
    bool completed_;

    std::promise<IOResult> promise_;
    std::shared_future<IOResult> future_;

    /** @brief Demand from the inner stage. */
    void relay_request_();

    /** @brief Cancellation from the inner stage. */
    void relay_cancel_();

    void finish_upstream_(std::optional<std::string> failure);
    void complete_(const IOResult& result);
};
} // namespace fileio
