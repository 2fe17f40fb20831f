#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    using LogSink = std::function<void(std::chrono::system_clock::time_point const&, Log::Level, std::string const&)>;

    class Logger
    {
      public:
        Logger()
            : guard_{}
            , sink_{}
        {}

        /**
         * @brief Installs a function that receives every message passing the level filter, in addition to spdlog.
         * Pass an empty function to remove it.
         */
        void setSink(LogSink sink)
        {
            std::scoped_lock lock{guard_};
            sink_ = std::move(sink);
        }

        void setLevel(Log::Level level)
        {
            spdlog::set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            return fromSpdlogLevel(spdlog::get_level());
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            if (level == Log::Level::Off || level < this->level())
                return;

            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            logImpl(level, buf);
        }

        void logImpl(Log::Level level, std::string const& msg)
        {
            {
                // Workers log concurrently, the sink sees one message at a time.
                std::scoped_lock lock{guard_};
                if (sink_)
                    sink_(std::chrono::system_clock::now(), level, msg);
            }

            spdlog::log(toSpdlogLevel(level), msg);
        }

      private:
        std::recursive_mutex guard_;
        LogSink sink_;
    };
}
