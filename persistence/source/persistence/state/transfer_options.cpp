#include <persistence/state/transfer_options.hpp>

namespace Persistence
{
    void BrowserOptions::useDefaultsFrom(BrowserOptions const& other)
    {
        if (!rootPath)
            rootPath = other.rootPath;
    }
    void to_json(nlohmann::json& j, BrowserOptions const& options)
    {
        j = nlohmann::json::object();
        if (options.rootPath)
            j["rootPath"] = *options.rootPath;
    }
    void from_json(nlohmann::json const& j, BrowserOptions& options)
    {
        if (j.contains("rootPath"))
            options.rootPath = j["rootPath"].get<std::string>();
    }

    void TransferOptions::useDefaultsFrom(TransferOptions const& other)
    {
        if (!defaultDestination)
            defaultDestination = other.defaultDestination;
    }
    void to_json(nlohmann::json& j, TransferOptions const& options)
    {
        j = nlohmann::json::object();
        if (options.defaultDestination)
            j["defaultDestination"] = *options.defaultDestination;
    }
    void from_json(nlohmann::json const& j, TransferOptions& options)
    {
        if (j.contains("defaultDestination"))
            options.defaultDestination = j["defaultDestination"].get<std::string>();
    }
}
