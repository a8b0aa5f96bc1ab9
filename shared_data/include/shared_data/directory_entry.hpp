#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace SharedData
{
    /**
     * @brief One line of a remote directory listing.
     */
    struct DirectoryEntry
    {
        // Directories carry a trailing slash.
        std::string name{};
        // Preformatted by the worker, e.g. "1.2 MB" or "-".
        std::string size{};
        bool isDirectory{false};
    };

    void to_json(nlohmann::json& j, DirectoryEntry const& entry);
    void from_json(nlohmann::json const& j, DirectoryEntry& entry);
}
