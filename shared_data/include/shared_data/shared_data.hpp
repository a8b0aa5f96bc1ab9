#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>

namespace SharedData
{
    /**
     * @brief Reads an optional member. Absent and null members both yield the fallback.
     */
    template <typename T>
    T valueOr(nlohmann::json const& j, char const* key, T fallback)
    {
        if (auto iter = j.find(key); iter != j.end() && !iter->is_null())
            return iter->template get<T>();
        return fallback;
    }

    template <typename T>
    void optionalFromJson(nlohmann::json const& j, char const* key, std::optional<T>& target)
    {
        if (auto iter = j.find(key); iter != j.end() && !iter->is_null())
            target = iter->template get<T>();
        else
            target = std::nullopt;
    }

    template <typename T>
    void optionalToJson(nlohmann::json& j, char const* key, std::optional<T> const& source)
    {
        if (source)
            j[key] = *source;
        else
            j[key] = nullptr;
    }
}
