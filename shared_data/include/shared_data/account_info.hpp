#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace SharedData
{
    /**
     * @brief A cloud account as known to the worker. Timestamps are ISO 8601 strings.
     */
    struct AccountInfo
    {
        std::string userId{};
        std::string plan{};
        std::string container{};
        std::string created{};
        std::string expiry{};
        std::optional<double> limitGb{std::nullopt};
        std::optional<double> usageGb{std::nullopt};

        /**
         * @brief Date part of the creation timestamp.
         */
        std::string createdDate() const
        {
            return created.substr(0, created.find('T'));
        }
    };

    void to_json(nlohmann::json& j, AccountInfo const& info);
    void from_json(nlohmann::json const& j, AccountInfo& info);
}
