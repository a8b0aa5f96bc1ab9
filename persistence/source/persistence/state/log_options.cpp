#include <persistence/state/log_options.hpp>

namespace Persistence
{
    void LogOptions::useDefaultsFrom(LogOptions const& other)
    {
        if (!level)
            level = other.level;
        if (!file)
            file = other.file;
        if (!colorConsole)
            colorConsole = other.colorConsole;
    }
    void to_json(nlohmann::json& j, LogOptions const& options)
    {
        j = nlohmann::json::object();
        if (options.level)
            j["level"] = Log::levelToString(*options.level);
        if (options.file)
            j["file"] = *options.file;
        if (options.colorConsole)
            j["colorConsole"] = *options.colorConsole;
    }
    void from_json(nlohmann::json const& j, LogOptions& options)
    {
        if (j.contains("level"))
            options.level = Log::levelFromString(j["level"].get<std::string>());
        if (j.contains("file"))
            options.file = j["file"].get<std::string>();
        if (j.contains("colorConsole"))
            options.colorConsole = j["colorConsole"].get<bool>();
    }
}
