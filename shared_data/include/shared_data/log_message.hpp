#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace SharedData
{
    struct LogMessage
    {
        std::string data{};
        // Free-form severity tag.
        std::string type{"info"};
    };

    void to_json(nlohmann::json& j, LogMessage const& message);
    void from_json(nlohmann::json const& j, LogMessage& message);
}
