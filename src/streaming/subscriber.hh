#pragma once

#include <cstddef> // std::byte
#include <memory>
#include <string>
#include <vector>

namespace fileio {
using Chunk = std::vector<std::byte>;

/**
 * @brief The demand channel from a consumer back to its producer.
 */
class Upstream
{
  public:
    virtual ~Upstream() = default;

    /** @brief Signal demand for exactly one more chunk. */
    virtual void request() = 0;

    /** @brief Stop emitting. Chunks already in transit may still arrive. */
    virtual void cancel() = 0;
};

/**
 * @brief A consumer of byte-chunks.
 * @details A producer calls on_subscribe() once, then on_push() at most once
 * per request() it has received, and finally at most one of on_complete()
 * and on_error(). Completion and failure may arrive without outstanding
 * demand.
 */
class Subscriber
{
  public:
    virtual ~Subscriber() = default;

    virtual void on_subscribe(std::shared_ptr<Upstream> upstream) = 0;
    virtual void on_push(Chunk&& chunk) = 0;
    virtual void on_complete() = 0;
    virtual void on_error(const std::string& reason) = 0;
};
} // namespace fileio
