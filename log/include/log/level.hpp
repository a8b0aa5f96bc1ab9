#pragma once

#include <utility/algorithm/case_convert.hpp>

#include <spdlog/spdlog.h>

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

    inline spdlog::level::level_enum toSpdlogLevel(Level lvl)
    {
        switch (lvl)
        {
            case Level::Trace:
                return spdlog::level::trace;
            case Level::Debug:
                return spdlog::level::debug;
            case Level::Info:
                return spdlog::level::info;
            case Level::Warning:
                return spdlog::level::warn;
            case Level::Error:
                return spdlog::level::err;
            case Level::Critical:
                return spdlog::level::critical;
            case Level::Off:
                return spdlog::level::off;
            default:
                return spdlog::level::info;
        }
    }

    inline Level levelFromString(std::string_view str)
    {
        std::string lowered = Utility::Algorithm::toLowerCase(std::string{str});

        if (lowered == "trace")
            return Level::Trace;
        else if (lowered == "debug")
            return Level::Debug;
        else if (lowered == "info")
            return Level::Info;
        else if (lowered == "warning")
            return Level::Warning;
        else if (lowered == "error")
            return Level::Error;
        else if (lowered == "critical")
            return Level::Critical;
        else if (lowered == "off")
            return Level::Off;
        else
            return Level::Info;
    }

    inline std::string levelToString(Level lvl)
    {
        switch (lvl)
        {
            case Level::Trace:
                return "trace";
            case Level::Debug:
                return "debug";
            case Level::Info:
                return "info";
            case Level::Warning:
                return "warning";
            case Level::Error:
                return "error";
            case Level::Critical:
                return "critical";
            case Level::Off:
                return "off";
            default:
                return "info";
        }
    }

    /**
     * @brief Maps the free-form severity tag of a worker log line to a level.
     * Unknown tags and "success" are informational.
     *
     * @param tag The type tag of the log line, e.g. "info", "warning", "error".
     * @return Level
     */
    inline Level levelFromWorkerTag(std::string_view tag)
    {
        const std::string lowered = Utility::Algorithm::toLowerCase(std::string{tag});

        if (lowered == "warning" || lowered == "warn")
            return Level::Warning;
        else if (lowered == "error")
            return Level::Error;
        else if (lowered == "debug")
            return Level::Debug;
        return Level::Info;
    }
}
