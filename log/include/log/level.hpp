#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
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
        struct LevelMapping
        {
            Level level;
            spdlog::level::level_enum spdlogLevel;
            std::string_view name;
        };

        // Names are the ones used in the configuration file.
        inline constexpr std::array<LevelMapping, 7> levelMappings{{
            {Level::Trace, spdlog::level::trace, "trace"},
            {Level::Debug, spdlog::level::debug, "debug"},
            {Level::Info, spdlog::level::info, "info"},
            {Level::Warning, spdlog::level::warn, "warning"},
            {Level::Error, spdlog::level::err, "error"},
            {Level::Critical, spdlog::level::critical, "critical"},
            {Level::Off, spdlog::level::off, "off"},
        }};

        inline LevelMapping const& mappingOf(Level level)
        {
            auto iter = std::ranges::find(levelMappings, level, &LevelMapping::level);
            return iter != levelMappings.end() ? *iter : levelMappings[2];
        }
    }

    inline spdlog::level::level_enum toSpdlogLevel(Level level)
    {
        return Detail::mappingOf(level).spdlogLevel;
    }

    inline Level fromSpdlogLevel(spdlog::level::level_enum level)
    {
        auto iter = std::ranges::find(Detail::levelMappings, level, &Detail::LevelMapping::spdlogLevel);
        return iter != Detail::levelMappings.end() ? iter->level : Level::Info;
    }

    inline std::string levelToString(Level level)
    {
        return std::string{Detail::mappingOf(level).name};
    }

    /// Case insensitive. Unknown names yield Level::Info.
    inline Level levelFromString(std::string_view name)
    {
        auto const equalsIgnoringCase = [name](Detail::LevelMapping const& mapping) {
            return std::ranges::equal(name, mapping.name, [](char lhs, char rhs) {
                return std::tolower(static_cast<unsigned char>(lhs)) == rhs;
            });
        };
        auto iter = std::ranges::find_if(Detail::levelMappings, equalsIgnoringCase);
        return iter != Detail::levelMappings.end() ? iter->level : Level::Info;
    }
}
