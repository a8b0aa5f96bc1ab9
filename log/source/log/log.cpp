#include <log/log.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    void Logger::setup(LoggerOptions const& options)
    {
        std::vector<spdlog::sink_ptr> sinks{};
        if (options.colorConsole)
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        else
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

        if (options.logFile)
        {
            std::error_code ec;
            std::filesystem::create_directories(options.logFile->parent_path(), ec);
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.logFile->string(), false));
        }

        auto logger = std::make_shared<spdlog::logger>("courier", sinks.begin(), sinks.end());

        std::scoped_lock lock{guard_};
        logger->set_level(toSpdlogLevel(level_));
        logger->flush_on(spdlog::level::warn);
        logger_ = std::move(logger);

        for (auto const& [level, message] : stash_)
            logger_->log(toSpdlogLevel(level), message);
        stash_.clear();
    }

    void setup(LoggerOptions const& options)
    {
        Detail::logger.setup(options);
    }
}
