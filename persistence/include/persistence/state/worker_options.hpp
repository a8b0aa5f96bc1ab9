#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace Persistence
{
    /**
     * @brief Where the worker process listens.
     */
    struct WorkerOptions
    {
        std::optional<std::string> host{std::nullopt};
        std::optional<unsigned short> port{std::nullopt};
        // HTTP target of the event channel websocket.
        std::optional<std::string> eventTarget{std::nullopt};

        void useDefaultsFrom(WorkerOptions const& other);
    };
    void to_json(nlohmann::json& j, WorkerOptions const& options);
    void from_json(nlohmann::json const& j, WorkerOptions& options);
}
