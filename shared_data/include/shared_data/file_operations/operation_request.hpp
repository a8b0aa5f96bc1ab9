#pragma once

#include <shared_data/file_operations/operation_kind.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace SharedData
{
    /**
     * @brief A bulk operation as submitted to the worker. Encodes to the start_operation payload.
     */
    struct OperationRequest
    {
        OperationKind kind{OperationKind::Copy};
        // Remote paths. Directories end with a slash and are expanded by the worker.
        std::vector<std::string> sourcePaths{};
        std::string destinationPath{};
        std::optional<std::string> userId{std::nullopt};
    };

    void to_json(nlohmann::json& j, OperationRequest const& request);
    void from_json(nlohmann::json const& j, OperationRequest& request);
}
