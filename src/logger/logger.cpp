#include "logger.hh"

#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>

namespace {
std::atomic<LogLevel> current_level{ LogLevel_Info };
std::mutex emit_mutex;

const char*
level_tag(LogLevel level)
{
    switch (level) {
        case LogLevel_Debug:
            return "[DEBUG]";
        case LogLevel_Info:
            return "[INFO]";
        case LogLevel_Warning:
            return "[WARNING]";
        default:
            return "[ERROR]";
    }
}

void
write_timestamp(std::ostream& os)
{
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                    1000;

    std::tm tm{};
    localtime_r(&time, &tm);

    os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
       << std::setw(3) << ms.count() << std::setfill(' ');
}
} // namespace

void
Logger::set_log_level(LogLevel level)
{
    current_level.store(level);
}

LogLevel
Logger::get_log_level()
{
    return current_level.load();
}

void
Logger::write_prefix_(std::ostream& os,
                      LogLevel level,
                      const char* file,
                      int line,
                      const char* func)
{
    write_timestamp(os);
    os << " " << level_tag(level) << " (" << std::this_thread::get_id()
       << ") " << std::filesystem::path(file).filename().string() << ":"
       << line << " " << func << ": ";
}

void
Logger::emit_(LogLevel level, const std::string& message)
{
    const LogLevel threshold = current_level.load();
    if (threshold == LogLevel_None || level < threshold) {
        return;
    }

    // errors go to stderr, everything else to stdout
    std::ostream& os = level >= LogLevel_Error ? std::cerr : std::cout;

    std::scoped_lock lock(emit_mutex);
    os << message << std::endl;
}
