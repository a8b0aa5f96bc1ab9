#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace Persistence
{
    struct BrowserOptions
    {
        // Remote directory the browser starts in and never leaves upwards.
        std::optional<std::string> rootPath{std::nullopt};

        void useDefaultsFrom(BrowserOptions const& other);
    };
    void to_json(nlohmann::json& j, BrowserOptions const& options);
    void from_json(nlohmann::json const& j, BrowserOptions& options);

    struct TransferOptions
    {
        // Local folder transfers land in, "~" is expanded.
        std::optional<std::string> defaultDestination{std::nullopt};

        void useDefaultsFrom(TransferOptions const& other);
    };
    void to_json(nlohmann::json& j, TransferOptions const& options);
    void from_json(nlohmann::json const& j, TransferOptions& options);
}
