#pragma once

#include "logger.types.h"

#include <sstream>
#include <string>
#include <utility>

class Logger
{
  public:
    static void set_log_level(LogLevel level);
    static LogLevel get_log_level();

    /**
     * @brief Format a log message and emit it if @p level passes the filter.
     * @return The formatted message, whether or not it was emitted.
     */
    template<typename... Args>
    static std::string log(LogLevel level,
                           const char* file,
                           int line,
                           const char* func,
                           Args&&... args)
    {
        std::ostringstream ss;
        write_prefix_(ss, level, file, line, func);
        (ss << ... << std::forward<Args>(args));

        std::string message = ss.str();
        emit_(level, message);

        return message;
    }

  private:
    static void write_prefix_(std::ostream& os,
                              LogLevel level,
                              const char* file,
                              int line,
                              const char* func);
    static void emit_(LogLevel level, const std::string& message);
};

#define LOG_DEBUG(...)                                                         \
    Logger::log(LogLevel_Debug, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)                                                          \
    Logger::log(LogLevel_Info, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARNING(...)                                                       \
    Logger::log(LogLevel_Warning, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...)                                                         \
    Logger::log(LogLevel_Error, __FILE__, __LINE__, __func__, __VA_ARGS__)
