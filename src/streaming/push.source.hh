#pragma once

#include "subscriber.hh"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace fileio {
/**
 * @brief Producer-driven source. offer() blocks the producer until the
 * subscriber has signalled demand.
 */
class PushSource final
  : public Upstream
  , public std::enable_shared_from_this<PushSource>
{
  public:
    PushSource();

    void subscribe(std::shared_ptr<Subscriber> subscriber);

    /**
     * @brief Hand a chunk to the subscriber once it has asked for one.
     * @return False if the stream was completed or cancelled before the chunk
     * could be delivered.
     */
    [[nodiscard]] bool offer(Chunk&& chunk);

    /** @brief Signal that no more chunks follow. */
    void complete();

    /** @brief Terminate the stream with an error. */
    void fail(const std::string& reason);

    void request() override;
    void cancel() override;

    [[nodiscard]] bool is_cancelled() const;

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::shared_ptr<Subscriber> subscriber_;
    size_t demand_;
    bool subscribed_;
    bool cancelled_;
    bool finished_;
    std::optional<std::string> failure_;

    void finish_(std::optional<std::string> failure);
};
} // namespace fileio
