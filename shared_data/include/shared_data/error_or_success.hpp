#pragma once

#include <shared_data/shared_data.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace SharedData
{
    namespace Detail
    {
        struct Empty
        {};
        inline void to_json(nlohmann::json& j, Empty const&)
        {
            j = nlohmann::json::object();
        }
        inline void from_json(nlohmann::json const&, Empty&)
        {}
    }

    /**
     * @brief Reply of a worker request. The worker answers either with "success": true and the payload, or
     * with "success": false and a "message" or "error" describing the failure.
     */
    template <typename Data = Detail::Empty>
    struct ErrorOrSuccess : public Data
    {
        std::optional<std::string> error{std::nullopt};
        ErrorOrSuccess() = default;
        ErrorOrSuccess(std::string const& error)
            : Data{}
            , error{error}
        {}
        ErrorOrSuccess(Data data)
            : Data{std::move(data)}
        {}
        bool success() const
        {
            return !error.has_value();
        }
        explicit operator bool() const
        {
            return success();
        }
    };

    template <typename Data = Detail::Empty>
    inline ErrorOrSuccess<Data> success()
    {
        return ErrorOrSuccess<Data>{};
    }
    template <typename Data = Detail::Empty>
    inline ErrorOrSuccess<Data> error(std::string msg)
    {
        return ErrorOrSuccess<Data>{std::move(msg)};
    }

    template <typename Data = Detail::Empty>
    void to_json(nlohmann::json& j, ErrorOrSuccess<Data> const& o)
    {
        if (o.error.has_value())
            j = nlohmann::json{{"success", false}, {"message", o.error.value()}};
        else
        {
            j = nlohmann::json::object();
            to_json(j, static_cast<Data const&>(o));
            j["success"] = true;
        }
    }
    template <typename Data = Detail::Empty>
    void from_json(nlohmann::json const& j, ErrorOrSuccess<Data>& o)
    {
        const bool succeeded = valueOr(j, "success", !j.contains("error"));
        if (!succeeded)
        {
            if (j.contains("message"))
                o.error = j.at("message").get<std::string>();
            else if (j.contains("error"))
                o.error = j.at("error").get<std::string>();
            else
                o.error = "Unknown error";
        }
        else
        {
            from_json(j, static_cast<Data&>(o));
            o.error = std::nullopt;
        }
    }

    /**
     * @brief Reply payload that only carries a human readable message.
     */
    struct Message
    {
        std::string message{};
    };
    inline void to_json(nlohmann::json& j, Message const& message)
    {
        j = nlohmann::json{{"message", message.message}};
    }
    inline void from_json(nlohmann::json const& j, Message& message)
    {
        message.message = valueOr(j, "message", std::string{});
    }
}
