#pragma once

#include <shared_data/account_info.hpp>
#include <shared_data/shared_data.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace SharedData
{
    struct Login
    {
        std::string user{};
        std::optional<AccountInfo> info{std::nullopt};
    };

    inline void to_json(nlohmann::json& j, Login const& login)
    {
        j = nlohmann::json{{"user", login.user}};
        if (login.info)
            j["info"] = *login.info;
    }
    inline void from_json(nlohmann::json const& j, Login& login)
    {
        j.at("user").get_to(login.user);
        optionalFromJson(j, "info", login.info);
    }
}
