#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Log
{
    struct LoggerOptions
    {
        std::optional<std::filesystem::path> logFile{std::nullopt};
        bool colorConsole{true};
    };

    class Logger
    {
      public:
        constexpr static std::size_t stashLimit = 1000;

        Logger()
            : guard_{}
            , logger_{nullptr}
            , stash_{}
            , level_{Level::Info}
        {}

        /**
         * @brief Installs the sinks and replays everything that was logged before.
         *
         * @param options Where to log to.
         */
        void setup(LoggerOptions const& options);

        void setLevel(Log::Level level)
        {
            std::scoped_lock lock{guard_};
            level_ = level;
            if (logger_)
                logger_->set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            std::scoped_lock lock{guard_};
            return level_;
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            if (level < this->level())
                return;

            const std::string buf = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
            logImpl(level, buf);
        }

        void logImpl(Log::Level level, std::string const& msg)
        {
            std::scoped_lock lock{guard_};
            if (logger_ == nullptr)
            {
                // for when the sinks are not yet configured
                if (stash_.size() == stashLimit)
                    stash_.erase(stash_.begin());
                stash_.emplace_back(level, msg);
                return;
            }

            logger_->log(toSpdlogLevel(level), msg);
        }

      private:
        mutable std::recursive_mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
        std::vector<std::pair<Log::Level, std::string>> stash_;
        Log::Level level_;
    };
}
