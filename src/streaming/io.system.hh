#pragma once

#include "file.write.stage.hh"
#include "iterable.source.hh"
#include "logger.types.h"
#include "thread.pool.hh"

#include <filesystem>
#include <functional> // std::less
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace fileio {
constexpr std::string_view default_dispatcher_name = "fileio.default-dispatcher";
constexpr std::string_view default_blocking_io_dispatcher_name =
  "fileio.default-blocking-io-dispatcher";

/**
 * @brief Per-stage configuration attributes.
 */
struct StageAttributes
{
    /* Dispatcher running the stage's blocking calls. Defaults to the system's
       blocking I/O dispatcher. */
    std::optional<std::string> dispatcher;
};

struct IOSystemSettings
{
    std::optional<LogLevel> log_level;
    std::string default_dispatcher{ default_dispatcher_name };
    std::string blocking_io_dispatcher{ default_blocking_io_dispatcher_name };
    std::map<std::string, unsigned int, std::less<>> dispatchers; // threads

    /** @brief The two default dispatchers and nothing else. */
    static IOSystemSettings defaults();

    /**
     * @brief Parse settings layered over defaults().
     * @throw std::runtime_error if the JSON is malformed or inconsistent.
     */
    static IOSystemSettings from_json(std::string_view json);
    static IOSystemSettings from_file(const std::filesystem::path& path);
};

[[nodiscard]] bool
validate_io_system_settings(const IOSystemSettings& settings, std::string& err);

/**
 * @brief Owns the process-wide dispatchers. Created once at startup and shut
 * down at exit; stages receive their dispatcher from it as a handle.
 */
class IOSystem
{
  public:
    explicit IOSystem(IOSystemSettings settings = IOSystemSettings::defaults());
    ~IOSystem() noexcept;

    IOSystem(const IOSystem&) = delete;
    IOSystem& operator=(const IOSystem&) = delete;

    /** @throw std::runtime_error if there is no dispatcher named @p name. */
    [[nodiscard]] std::shared_ptr<ThreadPool> dispatcher(
      std::string_view name) const;
    [[nodiscard]] std::shared_ptr<ThreadPool> default_dispatcher() const;
    [[nodiscard]] std::shared_ptr<ThreadPool> blocking_io_dispatcher() const;

    /**
     * @brief Create a stage writing to the file described by @p spec, bound
     * to the dispatcher selected by @p attributes.
     */
    [[nodiscard]] std::shared_ptr<FileWriteStage> to_path(
      OpenSpec spec,
      const StageAttributes& attributes = {},
      SinkFactory make_sink = make_file_sink) const;

    /** @brief A source emitting @p chunks on the default dispatcher. */
    [[nodiscard]] std::shared_ptr<IterableSource> source(
      std::vector<Chunk> chunks) const;

    /**
     * @brief Stop accepting jobs and wait for queued jobs to finish. Pipeline
     * dispatchers stop before the blocking I/O dispatcher.
     */
    void shutdown() noexcept;

    [[nodiscard]] const IOSystemSettings& settings() const noexcept;

  private:
    const IOSystemSettings settings_;
    std::map<std::string, std::shared_ptr<ThreadPool>, std::less<>> dispatchers_;
};
} // namespace fileio
