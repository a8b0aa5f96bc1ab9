#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace SharedData
{
    /**
     * @brief The merged operator decision sent with resolve_conflicts.
     * Conflicting paths that are not in pathsToOverwrite are skipped.
     */
    struct ConflictResolution
    {
        std::vector<std::string> pathsToOverwrite{};
        std::vector<std::string> pathsToProcessFirst{};
        bool isMoveOperation{false};
        std::string destinationPath{};
    };

    void to_json(nlohmann::json& j, ConflictResolution const& resolution);
    void from_json(nlohmann::json const& j, ConflictResolution& resolution);
}
