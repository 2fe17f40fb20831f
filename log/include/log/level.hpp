#pragma once

#include <spdlog/spdlog.h>

#include <utility/algorithm/case_convert.hpp>

#include <array>
#include <string>
#include <string_view>

namespace Log
{
    enum class Level
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Critical,
        Off
    };

    namespace Detail
    {
        struct LevelName
        {
            Level level;
            spdlog::level::level_enum spdlogLevel;
            std::string_view name;
        };

        // Ordered like Level.
        inline constexpr std::array<LevelName, 7> levelNames{{
            {Level::Trace, spdlog::level::trace, "trace"},
            {Level::Debug, spdlog::level::debug, "debug"},
            {Level::Info, spdlog::level::info, "info"},
            {Level::Warning, spdlog::level::warn, "warning"},
            {Level::Error, spdlog::level::err, "error"},
            {Level::Critical, spdlog::level::critical, "critical"},
            {Level::Off, spdlog::level::off, "off"},
        }};
    }

    inline spdlog::level::level_enum toSpdlogLevel(Level lvl)
    {
        for (auto const& entry : Detail::levelNames)
            if (entry.level == lvl)
                return entry.spdlogLevel;
        return spdlog::level::info;
    }

    inline Level fromSpdlogLevel(spdlog::level::level_enum lvl)
    {
        for (auto const& entry : Detail::levelNames)
            if (entry.spdlogLevel == lvl)
                return entry.level;
        return Level::Info;
    }

    /**
     * @brief Parses a level name as written in the options file ("warn" is accepted for "warning").
     * Unknown names yield the fallback.
     */
    inline Level levelFromString(std::string_view str, Level fallback = Level::Info)
    {
        const std::string lowered = Utility::Algorithm::toLowerCase(std::string{str});
        if (lowered == "warn")
            return Level::Warning;

        for (auto const& entry : Detail::levelNames)
            if (entry.name == lowered)
                return entry.level;
        return fallback;
    }

    inline std::string levelToString(Level lvl)
    {
        for (auto const& entry : Detail::levelNames)
            if (entry.level == lvl)
                return std::string{entry.name};
        return "info";
    }
}
