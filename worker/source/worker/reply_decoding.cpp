#include <worker/reply_decoding.hpp>

namespace Worker
{
    std::expected<nlohmann::json, ApiError> interpretHttpResponse(unsigned int status, std::string_view body)
    {
        const bool ok = status >= 200 && status < 300;

        nlohmann::json json = nlohmann::json::parse(body, nullptr, false);
        if (json.is_discarded())
        {
            if (ok)
                return std::unexpected(ApiError{
                    .type = ApiErrorType::InvalidResponse, .httpStatus = status, .extraInfo = "Body is not JSON"});
            return std::unexpected(ApiError{.type = ApiErrorType::HttpError, .httpStatus = status});
        }

        if (ok)
            return json;

        if (json.is_object())
        {
            for (auto const* key : {"message", "error"})
            {
                if (const auto iter = json.find(key); iter != json.end() && iter->is_string())
                {
                    return std::unexpected(ApiError{
                        .type = ApiErrorType::WorkerError,
                        .httpStatus = status,
                        .extraInfo = iter->get<std::string>(),
                    });
                }
            }
        }
        return std::unexpected(ApiError{.type = ApiErrorType::HttpError, .httpStatus = status});
    }
}
