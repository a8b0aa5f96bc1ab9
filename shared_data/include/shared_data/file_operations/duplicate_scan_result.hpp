#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace SharedData
{
    struct DuplicateGroup
    {
        std::optional<std::string> hash{std::nullopt};
        // The first file is the keeper by convention.
        std::vector<std::string> files{};
    };

    struct DuplicateScanResult
    {
        std::vector<std::string> uniqueFiles{};
        std::vector<DuplicateGroup> duplicateGroups{};
        // Convenience union of everything scanned, as reported by the worker. May be empty.
        std::vector<std::string> allFiles{};
    };

    void to_json(nlohmann::json& j, DuplicateGroup const& group);
    void from_json(nlohmann::json const& j, DuplicateGroup& group);
    void to_json(nlohmann::json& j, DuplicateScanResult const& result);
    void from_json(nlohmann::json const& j, DuplicateScanResult& result);
}
