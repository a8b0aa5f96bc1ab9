#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace SharedData
{
    /**
     * @brief Pushed by the worker with ask_for_overwrite when destination files already exist.
     * The order of conflictingPaths is the order in which the operator is asked.
     */
    struct ConflictBatch
    {
        std::vector<std::string> conflictingPaths{};
        std::vector<std::string> nonConflictingPaths{};
        bool isMoveOperation{false};
    };

    void to_json(nlohmann::json& j, ConflictBatch const& batch);
    void from_json(nlohmann::json const& j, ConflictBatch& batch);
}
