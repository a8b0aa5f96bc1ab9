#pragma once

#include <worker/api_error.hpp>
#include <shared_data/error_or_success.hpp>

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace Worker
{
    /**
     * @brief Turns a raw HTTP reply into JSON. Error statuses whose body carries "message" or "error" become
     * WorkerError with that text, other error statuses become HttpError.
     */
    std::expected<nlohmann::json, ApiError> interpretHttpResponse(unsigned int status, std::string_view body);

    /**
     * @brief Decodes a reply that is the payload itself, like a listing array.
     * An object carrying "error" instead is a WorkerError.
     */
    template <typename T>
    std::expected<T, ApiError> decodePlainReply(nlohmann::json const& json)
    {
        if (json.is_object() && json.contains("error") && json["error"].is_string())
            return std::unexpected(
                ApiError{.type = ApiErrorType::WorkerError, .extraInfo = json["error"].get<std::string>()});

        try
        {
            return json.get<T>();
        }
        catch (nlohmann::json::exception const& e)
        {
            return std::unexpected(ApiError{.type = ApiErrorType::InvalidResponse, .extraInfo = e.what()});
        }
    }

    /**
     * @brief Decodes a {"success": ..., ...} reply.
     */
    template <typename T>
    std::expected<T, ApiError> decodeErrorOrSuccess(nlohmann::json const& json)
    {
        if (!json.is_object())
            return std::unexpected(
                ApiError{.type = ApiErrorType::InvalidResponse, .extraInfo = "Reply is not a JSON object"});

        SharedData::ErrorOrSuccess<T> reply{};
        try
        {
            json.get_to(reply);
        }
        catch (nlohmann::json::exception const& e)
        {
            return std::unexpected(ApiError{.type = ApiErrorType::InvalidResponse, .extraInfo = e.what()});
        }

        if (!reply.success())
            return std::unexpected(ApiError{.type = ApiErrorType::WorkerError, .extraInfo = *reply.error});

        return static_cast<T>(reply);
    }
}
