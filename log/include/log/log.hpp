#pragma once

#include <log/level.hpp>
#include <log/logger.hpp>

#include <string_view>
#include <utility>

namespace Log
{
    namespace Detail
    {
        extern Logger logger;
    }

    /**
     * @brief Formats with fmt syntax and logs through spdlog, and through the sink if one is installed.
     * Safe to call from several download workers at once.
     */
    template <typename... Args>
    void log(Log::Level level, std::string_view fmt, Args&&... args)
    {
        Detail::logger.log(level, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Forwards every message that passes the level filter to onLog as well. onLog is never called
     * concurrently.
     */
    void setSink(LogSink onLog);
    void resetSink();

    inline void setLevel(Log::Level level)
    {
        Detail::logger.setLevel(level);
    }
    inline Log::Level level()
    {
        return Detail::logger.level();
    }

    template <typename... Args>
    void trace(std::string_view fmt, Args&&... args)
    {
        log(Log::Level::Trace, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug(std::string_view fmt, Args&&... args)
    {
        log(Log::Level::Debug, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info(std::string_view fmt, Args&&... args)
    {
        log(Log::Level::Info, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn(std::string_view fmt, Args&&... args)
    {
        log(Log::Level::Warning, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error(std::string_view fmt, Args&&... args)
    {
        log(Log::Level::Error, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void critical(std::string_view fmt, Args&&... args)
    {
        log(Log::Level::Critical, fmt, std::forward<Args>(args)...);
    }
}
