#include <shared_data/file_operations/operation_request.hpp>
#include <shared_data/shared_data.hpp>

namespace SharedData
{
    void to_json(nlohmann::json& j, OperationRequest const& request)
    {
        j = nlohmann::json{
            {"operation", request.kind},
            {"paths", request.sourcePaths},
            {"dest_folder", request.destinationPath},
        };
        optionalToJson(j, "user_id", request.userId);
    }
    void from_json(nlohmann::json const& j, OperationRequest& request)
    {
        j.at("operation").get_to(request.kind);
        request.sourcePaths = valueOr(j, "paths", std::vector<std::string>{});
        request.destinationPath = valueOr(j, "dest_folder", std::string{});
        optionalFromJson(j, "user_id", request.userId);
    }
}
