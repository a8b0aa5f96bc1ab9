#pragma once

#include <shared_data/shared_data.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace SharedData
{
    /**
     * @brief A remote file materialized on the local filesystem.
     */
    struct PreviewFile
    {
        std::string localPath{};
    };

    inline void to_json(nlohmann::json& j, PreviewFile const& preview)
    {
        j = nlohmann::json{{"local_path", preview.localPath}};
    }
    inline void from_json(nlohmann::json const& j, PreviewFile& preview)
    {
        j.at("local_path").get_to(preview.localPath);
    }
}
