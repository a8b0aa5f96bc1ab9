#include <persistence/state_holder.hpp>
#include <log/log.hpp>

#include <fmt/chrono.h>

#include <chrono>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace Persistence
{
    StateHolder::StateHolder(std::filesystem::path configFile)
        : configFile_{std::move(configFile)}
        , stateCache_{}
    {}

    State& StateHolder::stateCache()
    {
        return stateCache_;
    }

    std::filesystem::path const& StateHolder::configFile() const
    {
        return configFile_;
    }

    namespace
    {
        std::filesystem::path backupPathOf(std::filesystem::path const& file)
        {
            const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
            return file.parent_path() / fmt::format("{}.backup_{:%Y-%m-%d_%H-%M-%S}", file.filename().string(), now);
        }
    }

    void StateHolder::load(std::function<void(bool, StateHolder&)> const& onLoad)
    {
        try
        {
            const auto stored = readConfigFile();
            stateCache_ = stored ? stored->get<State>() : State{};
            dataFixer(stored.value_or(nlohmann::json::object()));
            onLoad(true, *this);
        }
        catch (std::exception const& e)
        {
            Log::error("Failed to load config file: {}", e.what());
            onLoad(false, *this);
        }
    }

    std::optional<nlohmann::json> StateHolder::readConfigFile() const
    {
        std::ifstream reader{configFile_, std::ios_base::binary};
        if (!reader.good())
        {
            Log::warn("Config file '{}' does not exist, creating it with defaults.", configFile_.string());
            return std::nullopt;
        }

        try
        {
            auto stored = nlohmann::json::parse(reader, nullptr, true, true);
            if (stored.is_null())
                return std::nullopt;
            return std::optional<nlohmann::json>{std::in_place, std::move(stored)};
        }
        catch (nlohmann::json::parse_error const& e)
        {
            Log::error("Config file '{}' cannot be parsed: {}", configFile_.string(), e.what());
        }

        reader.close();
        backupConfigFile();
        return std::nullopt;
    }

    void StateHolder::backupConfigFile() const
    {
        const auto backup = backupPathOf(configFile_);

        std::error_code ec;
        std::filesystem::copy_file(configFile_, backup, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec)
            Log::error("Could not back up '{}': {}", configFile_.string(), ec.message());
        else
            Log::info("Unreadable config file kept as '{}'.", backup.string());
    }

    void StateHolder::dataFixer(nlohmann::json const& before)
    {
        stateCache_ = stateCache_.fullyResolve();

        const auto after = nlohmann::json(stateCache_);
        const auto diff = nlohmann::json::diff(before, after);

        if (!diff.empty())
        {
            Log::warn("Config diff: {}", diff.dump());
            Log::warn("Config file misses some defaults, writing them back to disk.");
            save();
        }
    }

    void StateHolder::save(std::function<void()> const& onSaveComplete)
    {
        try
        {
            const auto parentPath = configFile_.parent_path();
            if (!parentPath.empty() && !std::filesystem::exists(parentPath))
                std::filesystem::create_directories(parentPath);

            std::ofstream writer{configFile_, std::ios_base::binary};
            if (!writer.good())
                throw std::runtime_error("Cannot open '" + configFile_.string() + "' for writing.");

            writer << nlohmann::json(stateCache_).dump(4);
            onSaveComplete();
        }
        catch (std::exception const& e)
        {
            Log::error("Failed to save config file: {}", e.what());
            throw;
        }
    }
}
