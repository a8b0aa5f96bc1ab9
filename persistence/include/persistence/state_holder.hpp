#pragma once

#include <persistence/state/state.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <optional>

namespace Persistence
{
    class StateHolder
    {
      public:
        explicit StateHolder(std::filesystem::path configFile);

        /**
         * @brief Reads the config file. A file that cannot be parsed is copied to a timestamped backup
         * and replaced by defaults. Missing defaults are written back.
         *
         * @param onLoad Called with false if the state could not be loaded at all.
         */
        void load(std::function<void(bool, StateHolder&)> const& onLoad);

        /**
         * @brief Writes the cached state to the config file. Throws on failure.
         */
        void save(std::function<void()> const& onSaveComplete = []() {});

        State& stateCache();
        std::filesystem::path const& configFile() const;

        void dataFixer(nlohmann::json const& before);

      private:
        std::optional<nlohmann::json> readConfigFile() const;
        void backupConfigFile() const;

      private:
        std::filesystem::path configFile_;
        State stateCache_;
    };
}
