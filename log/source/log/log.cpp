#include <log/log.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    void setupLogger(Log::Level level, std::optional<std::filesystem::path> const& logFile)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (logFile)
        {
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile->string(), false));
            }
            catch (spdlog::spdlog_ex const& exc)
            {
                Detail::logger.setup(sinks, level);
                Log::error("Failed to open log file '{}': {}", logFile->string(), exc.what());
                return;
            }
        }
        Detail::logger.setup(std::move(sinks), level);
    }
}
