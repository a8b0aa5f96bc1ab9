#include <persistence/state/state.hpp>

namespace Persistence
{
    State State::defaults()
    {
        return State{
            .worker =
                WorkerOptions{
                    .host = "127.0.0.1",
                    .port = 5000,
                    .eventTarget = "/events",
                },
            .browser =
                BrowserOptions{
                    .rootPath = "/sdcard/",
                },
            .transfer =
                TransferOptions{
                    .defaultDestination = "~/PhoneBackup",
                },
            .logging =
                LogOptions{
                    .level = Log::Level::Info,
                    .file = std::nullopt,
                    .colorConsole = true,
                },
        };
    }

    State State::fullyResolve() const
    {
        State resolved{*this};
        const auto fallback = defaults();

        resolved.worker.useDefaultsFrom(fallback.worker);
        resolved.browser.useDefaultsFrom(fallback.browser);
        resolved.transfer.useDefaultsFrom(fallback.transfer);
        resolved.logging.useDefaultsFrom(fallback.logging);

        return resolved;
    }

    void to_json(nlohmann::json& j, State const& state)
    {
        j = nlohmann::json::object();

        j["worker"] = state.worker;
        j["browser"] = state.browser;
        j["transfer"] = state.transfer;
        j["logging"] = state.logging;
    }
    void from_json(nlohmann::json const& j, State& state)
    {
        if (j.contains("worker"))
            j.at("worker").get_to(state.worker);

        if (j.contains("browser"))
            j.at("browser").get_to(state.browser);

        if (j.contains("transfer"))
            j.at("transfer").get_to(state.transfer);

        if (j.contains("logging"))
            j.at("logging").get_to(state.logging);
    }
}
