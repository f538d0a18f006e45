#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Log
{
    class Logger
    {
      public:
        Logger()
            : guard_{}
            , logger_{}
        {}

        void setup(std::vector<spdlog::sink_ptr> sinks, Log::Level level)
        {
            std::scoped_lock lock{guard_};
            logger_ = std::make_shared<spdlog::logger>("twinpane", sinks.begin(), sinks.end());
            logger_->set_level(toSpdlogLevel(level));
            logger_->flush_on(spdlog::level::warn);
        }

        void setLevel(Log::Level level)
        {
            std::scoped_lock lock{guard_};
            if (logger_)
                logger_->set_level(toSpdlogLevel(level));
            spdlog::set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            std::scoped_lock lock{guard_};
            if (logger_)
                return fromSpdlogLevel(logger_->level());
            return fromSpdlogLevel(spdlog::get_level());
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            logImpl(level, buf);
        }

        void logImpl(Log::Level level, std::string const& msg)
        {
            std::shared_ptr<spdlog::logger> target;
            {
                std::scoped_lock lock{guard_};
                target = logger_;
            }
            // Falls back to the spdlog default logger until setup was called.
            if (target)
                target->log(toSpdlogLevel(level), msg);
            else
                spdlog::log(toSpdlogLevel(level), msg);
        }

      private:
        mutable std::mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
    };
}
