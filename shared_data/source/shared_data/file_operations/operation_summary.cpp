#include <shared_data/file_operations/operation_summary.hpp>

namespace SharedData
{
    void to_json(nlohmann::json& j, OperationSummary const& summary)
    {
        j = nlohmann::json{
            {"operation", summary.kind},
            {"success", summary.succeededCount},
            {"failed", summary.failedCount},
        };
    }
    void from_json(nlohmann::json const& j, OperationSummary& summary)
    {
        j.at("operation").get_to(summary.kind);
        j.at("success").get_to(summary.succeededCount);
        j.at("failed").get_to(summary.failedCount);
    }
}
