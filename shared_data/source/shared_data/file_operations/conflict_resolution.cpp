#include <shared_data/file_operations/conflict_resolution.hpp>

namespace SharedData
{
    void to_json(nlohmann::json& j, ConflictResolution const& resolution)
    {
        j = nlohmann::json{
            {"to_overwrite", resolution.pathsToOverwrite},
            {"to_process_first", resolution.pathsToProcessFirst},
            {"is_move_op", resolution.isMoveOperation},
            {"dest_folder", resolution.destinationPath},
        };
    }
    void from_json(nlohmann::json const& j, ConflictResolution& resolution)
    {
        j.at("to_overwrite").get_to(resolution.pathsToOverwrite);
        j.at("to_process_first").get_to(resolution.pathsToProcessFirst);
        j.at("is_move_op").get_to(resolution.isMoveOperation);
        j.at("dest_folder").get_to(resolution.destinationPath);
    }
}
