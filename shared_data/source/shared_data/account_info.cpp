#include <shared_data/account_info.hpp>
#include <shared_data/shared_data.hpp>

namespace SharedData
{
    void to_json(nlohmann::json& j, AccountInfo const& info)
    {
        j = nlohmann::json{
            {"user_id", info.userId},
            {"plan", info.plan},
            {"container", info.container},
            {"created", info.created},
            {"expiry", info.expiry},
        };
        if (info.limitGb)
            j["limit_gb"] = *info.limitGb;
        if (info.usageGb)
            j["usage_gb"] = *info.usageGb;
    }
    void from_json(nlohmann::json const& j, AccountInfo& info)
    {
        info.userId = valueOr(j, "user_id", std::string{});
        info.plan = valueOr(j, "plan", std::string{});
        info.container = valueOr(j, "container", std::string{});
        info.created = valueOr(j, "created", std::string{});
        info.expiry = valueOr(j, "expiry", std::string{});
        optionalFromJson(j, "limit_gb", info.limitGb);
        optionalFromJson(j, "usage_gb", info.usageGb);
    }
}
