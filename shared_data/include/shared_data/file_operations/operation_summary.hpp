#pragma once

#include <shared_data/file_operations/operation_kind.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>

namespace SharedData
{
    /**
     * @brief Tally of a finished operation, as reported by operation_complete.
     */
    struct OperationSummary
    {
        OperationKind kind{OperationKind::Copy};
        std::uint64_t succeededCount{0};
        std::uint64_t failedCount{0};
    };

    void to_json(nlohmann::json& j, OperationSummary const& summary);
    void from_json(nlohmann::json const& j, OperationSummary& summary);
}
