#pragma once

#include <cstddef> // size_t, std::byte
#include <cstdint> // uint64_t
#include <functional>
#include <memory> // std::unique_ptr
#include <span>   // std::span
#include <string>

namespace fileio {
struct OpenSpec;

class Sink
{
  public:
    virtual ~Sink() = default;

    /**
     * @brief Write data to the sink at its cursor.
     * @param data The buffer to write to the sink.
     * @return True if the whole buffer was written, false otherwise. On
     * failure, error() describes the cause.
     */
    [[nodiscard]] virtual bool write(std::span<const std::byte> data) = 0;

    /**
     * @brief Release the underlying resource.
     * @note Idempotent. Safe to call after a failed write.
     * @return True if the resource was released cleanly, false otherwise.
     */
    [[nodiscard]] virtual bool close() = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;

    /** @brief Bytes accepted by the sink, including partial progress. */
    [[nodiscard]] uint64_t bytes_written() const noexcept;

    /** @brief The last error message. Empty if no error occurred. */
    [[nodiscard]] const std::string& error() const noexcept;

  protected:
    uint64_t bytes_written_{ 0 };
    std::string error_;

    void set_error_(const std::string& msg);
};

using SinkFactory = std::function<std::unique_ptr<Sink>(const OpenSpec&)>;

bool
finalize_sink(std::unique_ptr<Sink>&& sink);
} // namespace fileio
