#include <shared_data/worker_status.hpp>
#include <shared_data/shared_data.hpp>

namespace SharedData
{
    void to_json(nlohmann::json& j, WorkerStatusLevel const& level)
    {
        switch (level)
        {
            case WorkerStatusLevel::Success:
                j = "success";
                return;
            case WorkerStatusLevel::Warning:
                j = "warning";
                return;
            case WorkerStatusLevel::Error:
                j = "error";
                return;
        }
    }
    void from_json(nlohmann::json const& j, WorkerStatusLevel& level)
    {
        const auto str = j.get<std::string>();
        if (str == "success")
            level = WorkerStatusLevel::Success;
        else if (str == "warning")
            level = WorkerStatusLevel::Warning;
        else
            level = WorkerStatusLevel::Error;
    }

    void to_json(nlohmann::json& j, WorkerStatus const& status)
    {
        j = nlohmann::json{
            {"status", status.level},
            {"message", status.message},
        };
    }
    void from_json(nlohmann::json const& j, WorkerStatus& status)
    {
        j.at("status").get_to(status.level);
        status.message = valueOr(j, "message", std::string{});
    }
}
