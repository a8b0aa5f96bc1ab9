#include <persistence/paths.hpp>

#include <cstdlib>
#include <string>

namespace Persistence
{
    namespace
    {
        std::filesystem::path homeDirectory()
        {
            if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0')
                return std::filesystem::path{home};
            return std::filesystem::temp_directory_path();
        }
    }

    std::filesystem::path resolvePath(std::string_view path)
    {
        if (path.empty() || path.front() != '~')
            return std::filesystem::path{std::string{path}};

        if (path.size() == 1)
            return homeDirectory();

        if (path[1] != '/')
            return std::filesystem::path{std::string{path}};

        return homeDirectory() / std::string{path.substr(2)};
    }

    std::filesystem::path defaultConfigPath()
    {
        if (const char* configHome = std::getenv("XDG_CONFIG_HOME"); configHome != nullptr && *configHome != '\0')
            return std::filesystem::path{configHome} / "courier" / "config.json";

        return homeDirectory() / ".config" / "courier" / "config.json";
    }
}
