#pragma once

#include <log/level.hpp>
#include <log/logger_backend.hpp>

#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>

/**
 * Process wide logging. Messages are fmt format strings:
 *
 *     Log::info("Transfer: copied '{}' ({} bytes).", name, size);
 */
namespace Log
{
    namespace Detail
    {
        extern Logger logger;
    }

    /**
     * @brief Installs a stderr sink and, when logFile is set, an appending file sink.
     */
    void setupLogger(Level level, std::optional<std::filesystem::path> const& logFile = std::nullopt);

    inline void setLevel(Level level)
    {
        Detail::logger.setLevel(level);
    }

    inline Level level()
    {
        return Detail::logger.level();
    }

    template <typename... Args>
    void log(Level level, std::string_view format, Args&&... args)
    {
        Detail::logger.log(level, format, std::forward<Args>(args)...);
    }

#define TWINPANE_LOG_SHORTHAND(name, lvl) \
    template <typename... Args> \
    void name(std::string_view format, Args&&... args) \
    { \
        log(Level::lvl, format, std::forward<Args>(args)...); \
    }

    TWINPANE_LOG_SHORTHAND(trace, Trace)
    TWINPANE_LOG_SHORTHAND(debug, Debug)
    TWINPANE_LOG_SHORTHAND(info, Info)
    TWINPANE_LOG_SHORTHAND(warn, Warning)
    TWINPANE_LOG_SHORTHAND(error, Error)
    TWINPANE_LOG_SHORTHAND(critical, Critical)

#undef TWINPANE_LOG_SHORTHAND
}
