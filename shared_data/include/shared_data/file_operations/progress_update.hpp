#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <algorithm>

namespace SharedData
{
    struct ProgressUpdate
    {
        std::uint64_t current{0};
        std::uint64_t total{0};

        /**
         * @brief The worker does not guarantee current <= total, the display must.
         */
        std::uint64_t clampedCurrent() const
        {
            return std::min(current, total);
        }
    };

    void to_json(nlohmann::json& j, ProgressUpdate const& progress);
    void from_json(nlohmann::json const& j, ProgressUpdate& progress);
}
