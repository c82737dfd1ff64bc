#pragma once

#include "sink.hh"
#include "open.spec.hh"

#include <string>

namespace fileio {
/**
 * @brief Exclusive owner of one open file descriptor for one write session.
 * @details The constructor opens the file and positions the cursor according
 * to the OpenSpec; it throws std::runtime_error if either step fails. The
 * descriptor is closed by close() or, failing that, by the destructor.
 */
class FileSink : public Sink
{
  public:
    explicit FileSink(const OpenSpec& spec);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    bool write(std::span<const std::byte> data) override;
    bool close() override;
    bool is_open() const noexcept override;

    [[nodiscard]] uint64_t cursor() const noexcept;
    [[nodiscard]] const std::string& path() const noexcept;

  private:
    std::string path_;
    int fd_;
    uint64_t cursor_;
    bool append_;
};

/** @brief The default SinkFactory. */
std::unique_ptr<Sink>
make_file_sink(const OpenSpec& spec);
} // namespace fileio
