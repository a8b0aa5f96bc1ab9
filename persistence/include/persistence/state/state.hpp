#pragma once

#include <persistence/state/worker_options.hpp>
#include <persistence/state/transfer_options.hpp>
#include <persistence/state/log_options.hpp>

#include <nlohmann/json.hpp>

namespace Persistence
{
    struct State
    {
        WorkerOptions worker{};
        BrowserOptions browser{};
        TransferOptions transfer{};
        LogOptions logging{};

        /**
         * @brief Values used for everything the config file leaves out.
         */
        static State defaults();

        /**
         * @brief Returns a copy in which every optional is filled from the defaults.
         */
        State fullyResolve() const;
    };

    void to_json(nlohmann::json& j, State const& state);
    void from_json(nlohmann::json const& j, State& state);
}
