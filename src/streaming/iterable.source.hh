#pragma once

#include "subscriber.hh"
#include "thread.pool.hh"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace fileio {
/**
 * @brief Pull-driven producer that emits one chunk per request.
 * @details Each request schedules one call of the generator on the
 * dispatcher. The stream completes when the generator returns std::nullopt
 * and fails when it throws.
 */
class IterableSource final
  : public Upstream
  , public std::enable_shared_from_this<IterableSource>
{
  public:
    using Generator = std::function<std::optional<Chunk>()>;

    IterableSource(Generator&& next, std::shared_ptr<ThreadPool> dispatcher);

    static std::shared_ptr<IterableSource> from_chunks(
      std::vector<Chunk> chunks,
      std::shared_ptr<ThreadPool> dispatcher);

    void subscribe(std::shared_ptr<Subscriber> subscriber);

    void request() override;
    void cancel() override;

    [[nodiscard]] size_t chunks_emitted() const;
    [[nodiscard]] bool is_cancelled() const;

  private:
    Generator next_;
    std::shared_ptr<ThreadPool> dispatcher_;

    mutable std::mutex mutex_;
    std::shared_ptr<Subscriber> subscriber_;
    size_t demand_;
    size_t emitted_;
    bool cancelled_;
    bool finished_;

    // serializes generator calls and pushes
    std::mutex emit_mutex_;

    [[nodiscard]] bool emit_(std::string& err);
    void finish_(const std::optional<std::string>& error);
};
} // namespace fileio
