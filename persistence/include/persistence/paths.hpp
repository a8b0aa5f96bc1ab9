#pragma once

#include <filesystem>
#include <string_view>

namespace Persistence
{
    /**
     * @brief Expands a leading "~" to the home directory of the user.
     */
    std::filesystem::path resolvePath(std::string_view path);

    /**
     * @brief $XDG_CONFIG_HOME/courier/config.json, falling back to ~/.config/courier/config.json.
     */
    std::filesystem::path defaultConfigPath();
}
