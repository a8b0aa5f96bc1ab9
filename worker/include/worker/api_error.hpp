#pragma once

#include <fmt/format.h>

#include <optional>
#include <string>

namespace Worker
{
    enum class ApiErrorType
    {
        // The worker could not be reached at all.
        ConnectionFailed,
        // Non 2xx status without a usable message.
        HttpError,
        // The body was not the JSON we expected.
        InvalidResponse,
        // The worker answered and reported a failure, extraInfo carries its message.
        WorkerError
    };

    inline std::string toString(ApiErrorType type)
    {
        switch (type)
        {
            case ApiErrorType::ConnectionFailed:
                return "ConnectionFailed";
            case ApiErrorType::HttpError:
                return "HttpError";
            case ApiErrorType::InvalidResponse:
                return "InvalidResponse";
            case ApiErrorType::WorkerError:
                return "WorkerError";
        }
        return "INVALID_ENUM_VALUE";
    }

    struct ApiError
    {
        ApiErrorType type;
        std::optional<unsigned int> httpStatus = std::nullopt;
        std::optional<std::string> extraInfo = std::nullopt;

        std::string toString() const
        {
            const auto enumString = Worker::toString(type);
            if (httpStatus && extraInfo)
                return fmt::format("{} ({}): {}.", enumString, *httpStatus, *extraInfo);
            if (httpStatus)
                return fmt::format("{} ({}).", enumString, *httpStatus);
            if (extraInfo)
                return fmt::format("{}: {}.", enumString, *extraInfo);
            return enumString;
        }

        /**
         * @brief The text an operator should see. The worker's own message where there is one.
         */
        std::string userMessage() const
        {
            if (type == ApiErrorType::WorkerError && extraInfo)
                return *extraInfo;
            return toString();
        }
    };
}
