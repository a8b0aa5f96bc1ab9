#include <persistence/state/worker_options.hpp>

namespace Persistence
{
    void WorkerOptions::useDefaultsFrom(WorkerOptions const& other)
    {
        if (!host)
            host = other.host;
        if (!port)
            port = other.port;
        if (!eventTarget)
            eventTarget = other.eventTarget;
    }
    void to_json(nlohmann::json& j, WorkerOptions const& options)
    {
        j = nlohmann::json::object();
        if (options.host)
            j["host"] = *options.host;
        if (options.port)
            j["port"] = *options.port;
        if (options.eventTarget)
            j["eventTarget"] = *options.eventTarget;
    }
    void from_json(nlohmann::json const& j, WorkerOptions& options)
    {
        if (j.contains("host"))
            options.host = j["host"].get<std::string>();
        if (j.contains("port"))
            options.port = j["port"].get<unsigned short>();
        if (j.contains("eventTarget"))
            options.eventTarget = j["eventTarget"].get<std::string>();
    }
}
