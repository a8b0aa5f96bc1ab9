#include <shared_data/directory_entry.hpp>
#include <shared_data/shared_data.hpp>

namespace SharedData
{
    void to_json(nlohmann::json& j, DirectoryEntry const& entry)
    {
        j = nlohmann::json{
            {"name", entry.name},
            {"size", entry.size},
            {"is_dir", entry.isDirectory},
        };
    }
    void from_json(nlohmann::json const& j, DirectoryEntry& entry)
    {
        j.at("name").get_to(entry.name);
        entry.isDirectory = valueOr(j, "is_dir", false);

        const auto size = j.find("size");
        if (size == j.end() || size->is_null())
            entry.size = "-";
        else if (size->is_string())
            entry.size = size->get<std::string>();
        else
            entry.size = size->dump();
    }
}
