#include <shared_data/file_operations/duplicate_scan_result.hpp>
#include <shared_data/shared_data.hpp>

namespace SharedData
{
    void to_json(nlohmann::json& j, DuplicateGroup const& group)
    {
        j = nlohmann::json{{"files", group.files}};
        if (group.hash)
            j["hash"] = *group.hash;
    }
    void from_json(nlohmann::json const& j, DuplicateGroup& group)
    {
        optionalFromJson(j, "hash", group.hash);
        j.at("files").get_to(group.files);
    }

    void to_json(nlohmann::json& j, DuplicateScanResult const& result)
    {
        j = nlohmann::json{
            {"uniques", result.uniqueFiles},
            {"duplicates", result.duplicateGroups},
            {"all_files", result.allFiles},
        };
    }
    void from_json(nlohmann::json const& j, DuplicateScanResult& result)
    {
        j.at("uniques").get_to(result.uniqueFiles);
        j.at("duplicates").get_to(result.duplicateGroups);
        result.allFiles = valueOr(j, "all_files", std::vector<std::string>{});
    }
}
