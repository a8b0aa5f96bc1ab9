#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace SharedData
{
    enum class WorkerStatusLevel
    {
        Success,
        Warning,
        Error
    };

    /**
     * @brief Reachability of the phone as seen by the worker.
     */
    struct WorkerStatus
    {
        WorkerStatusLevel level{WorkerStatusLevel::Error};
        std::string message{};

        bool usable() const
        {
            return level == WorkerStatusLevel::Success;
        }
    };

    void to_json(nlohmann::json& j, WorkerStatusLevel const& level);
    void from_json(nlohmann::json const& j, WorkerStatusLevel& level);
    void to_json(nlohmann::json& j, WorkerStatus const& status);
    void from_json(nlohmann::json const& j, WorkerStatus& status);
}
