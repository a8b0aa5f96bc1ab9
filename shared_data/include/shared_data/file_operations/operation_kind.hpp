#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace SharedData
{
    enum class OperationKind
    {
        Copy,
        Move,
        FindDuplicates,
        CloudBackup,
        CloudRestore
    };

    /**
     * @brief The name the worker expects in start_operation.
     */
    std::string_view toWireName(OperationKind kind);

    /**
     * @brief Decodes start_operation names as well as the progressive forms ("copying", "moving") that the worker
     * reports in operation_complete.
     */
    std::optional<OperationKind> operationKindFromWireName(std::string_view name);

    /**
     * @brief Human readable name, e.g. "Find duplicates".
     */
    std::string toDisplayString(OperationKind kind);

    inline bool isCloudOperation(OperationKind kind)
    {
        return kind == OperationKind::CloudBackup || kind == OperationKind::CloudRestore;
    }

    void to_json(nlohmann::json& j, OperationKind const& kind);
    void from_json(nlohmann::json const& j, OperationKind& kind);
}
