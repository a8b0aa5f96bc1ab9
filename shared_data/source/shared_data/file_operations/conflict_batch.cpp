#include <shared_data/file_operations/conflict_batch.hpp>
#include <shared_data/shared_data.hpp>

namespace SharedData
{
    void to_json(nlohmann::json& j, ConflictBatch const& batch)
    {
        j = nlohmann::json{
            {"conflicts", batch.conflictingPaths},
            {"non_conflicts", batch.nonConflictingPaths},
            {"is_move_op", batch.isMoveOperation},
        };
    }
    void from_json(nlohmann::json const& j, ConflictBatch& batch)
    {
        j.at("conflicts").get_to(batch.conflictingPaths);
        batch.nonConflictingPaths = valueOr(j, "non_conflicts", std::vector<std::string>{});
        batch.isMoveOperation = valueOr(j, "is_move_op", false);
    }
}
