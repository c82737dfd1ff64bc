#include "io.system.hh"
#include "macros.hh"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <thread>

namespace {
const unsigned int blocking_io_dispatcher_threads = 16;

LogLevel
log_level_from_string(std::string_view level)
{
    if (level == "debug") {
        return LogLevel_Debug;
    }
    if (level == "info") {
        return LogLevel_Info;
    }
    if (level == "warning") {
        return LogLevel_Warning;
    }
    if (level == "error") {
        return LogLevel_Error;
    }
    if (level == "none") {
        return LogLevel_None;
    }

    EXPECT(false, "Invalid log level: '", level, "'");
    return LogLevel_Info; // unreachable
}

unsigned int
threads_from_json(const std::string& name, const nlohmann::json& config)
{
    EXPECT(config.is_object(),
           "Dispatcher '",
           name,
           "' must be configured with an object");
    if (!config.contains("threads")) {
        return std::max(std::thread::hardware_concurrency(), 1u);
    }

    const auto& threads = config["threads"];
    EXPECT(threads.is_number_unsigned(),
           "Dispatcher '",
           name,
           "' needs a positive thread count, got ",
           threads.dump());

    const auto n_threads = threads.get<uint64_t>();
    EXPECT(n_threads > 0 &&
             n_threads <= std::numeric_limits<unsigned int>::max(),
           "Dispatcher '",
           name,
           "' needs a positive thread count, got ",
           threads.dump());

    return static_cast<unsigned int>(n_threads);
}
} // namespace

fileio::IOSystemSettings
fileio::IOSystemSettings::defaults()
{
    IOSystemSettings settings;
    settings.dispatchers.emplace(
      default_dispatcher_name,
      std::max(std::thread::hardware_concurrency(), 1u));
    settings.dispatchers.emplace(default_blocking_io_dispatcher_name,
                                 blocking_io_dispatcher_threads);

    return settings;
}

fileio::IOSystemSettings
fileio::IOSystemSettings::from_json(std::string_view json)
{
    auto settings = defaults();
    if (json.empty()) {
        return settings;
    }

    auto val = nlohmann::json::parse(json,
                                     nullptr, // callback
                                     false,   // allow exceptions
                                     true     // ignore comments
    );
    EXPECT(!val.is_discarded(), "Invalid JSON: ", json);
    EXPECT(val.is_object(), "Expected a JSON object, got ", val.dump());

    if (val.contains("log_level")) {
        EXPECT(val["log_level"].is_string(), "Field 'log_level' must be a string");
        settings.log_level =
          log_level_from_string(val["log_level"].get<std::string>());
    }

    if (val.contains("dispatchers")) {
        const auto& dispatchers = val["dispatchers"];
        EXPECT(dispatchers.is_object(), "Field 'dispatchers' must be an object");
        for (const auto& [name, config] : dispatchers.items()) {
            settings.dispatchers[name] = threads_from_json(name, config);
        }
    }

    if (val.contains("default_dispatcher")) {
        EXPECT(val["default_dispatcher"].is_string(),
               "Field 'default_dispatcher' must be a string");
        settings.default_dispatcher =
          val["default_dispatcher"].get<std::string>();
    }

    if (val.contains("blocking_io_dispatcher")) {
        EXPECT(val["blocking_io_dispatcher"].is_string(),
               "Field 'blocking_io_dispatcher' must be a string");
        settings.blocking_io_dispatcher =
          val["blocking_io_dispatcher"].get<std::string>();
    }

    std::string err;
    EXPECT(validate_io_system_settings(settings, err), err);

    return settings;
}

fileio::IOSystemSettings
fileio::IOSystemSettings::from_file(const std::filesystem::path& path)
{
    std::ifstream ifs(path);
    EXPECT(ifs.is_open(), "Failed to open settings file ", path);

    std::ostringstream ss;
    ss << ifs.rdbuf();

    return from_json(ss.str());
}

bool
fileio::validate_io_system_settings(const IOSystemSettings& settings,
                                    std::string& err)
{
    if (!settings.dispatchers.contains(settings.default_dispatcher)) {
        err = "Default dispatcher '" + settings.default_dispatcher +
              "' is not configured";
        return false;
    }

    if (!settings.dispatchers.contains(settings.blocking_io_dispatcher)) {
        err = "Blocking I/O dispatcher '" + settings.blocking_io_dispatcher +
              "' is not configured";
        return false;
    }

    for (const auto& [name, n_threads] : settings.dispatchers) {
        if (name.empty()) {
            err = "Dispatcher name is empty";
            return false;
        }
        if (n_threads == 0) {
            err = "Dispatcher '" + name + "' has no threads";
            return false;
        }
    }

    return true;
}

fileio::IOSystem::IOSystem(IOSystemSettings settings)
  : settings_{ std::move(settings) }
{
    std::string err;
    EXPECT(validate_io_system_settings(settings_, err),
           "Invalid I/O system settings: ",
           err);

    if (settings_.log_level) {
        Logger::set_log_level(*settings_.log_level);
    }

    for (const auto& [name, n_threads] : settings_.dispatchers) {
        dispatchers_.emplace(
          name,
          std::make_shared<ThreadPool>(
            name, n_threads, [pool_name = name](const std::string& err) {
                LOG_ERROR("Job on dispatcher '", pool_name, "' failed: ", err);
            }));
    }
}

fileio::IOSystem::~IOSystem() noexcept
{
    shutdown();
}

std::shared_ptr<fileio::ThreadPool>
fileio::IOSystem::dispatcher(std::string_view name) const
{
    auto it = dispatchers_.find(name);
    EXPECT(it != dispatchers_.end(), "No dispatcher named '", name, "'");

    return it->second;
}

std::shared_ptr<fileio::ThreadPool>
fileio::IOSystem::default_dispatcher() const
{
    return dispatcher(settings_.default_dispatcher);
}

std::shared_ptr<fileio::ThreadPool>
fileio::IOSystem::blocking_io_dispatcher() const
{
    return dispatcher(settings_.blocking_io_dispatcher);
}

std::shared_ptr<fileio::FileWriteStage>
fileio::IOSystem::to_path(OpenSpec spec,
                          const StageAttributes& attributes,
                          SinkFactory make_sink) const
{
    auto io_context = attributes.dispatcher
                        ? dispatcher(*attributes.dispatcher)
                        : blocking_io_dispatcher();

    return std::make_shared<FileWriteStage>(
      std::move(spec), std::move(io_context), std::move(make_sink));
}

std::shared_ptr<fileio::IterableSource>
fileio::IOSystem::source(std::vector<Chunk> chunks) const
{
    return IterableSource::from_chunks(std::move(chunks), default_dispatcher());
}

void
fileio::IOSystem::shutdown() noexcept
{
    for (auto& [name, pool] : dispatchers_) {
        if (name != settings_.blocking_io_dispatcher) {
            pool->await_stop();
        }
    }

    if (auto it = dispatchers_.find(settings_.blocking_io_dispatcher);
        it != dispatchers_.end()) {
        it->second->await_stop();
    }
}

const fileio::IOSystemSettings&
fileio::IOSystem::settings() const noexcept
{
    return settings_;
}
