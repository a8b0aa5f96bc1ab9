#pragma once

#include <worker/channel_error.hpp>

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace Worker
{
    /**
     * @brief One event as it travels in a text frame: {"event": <name>, "data": <payload>}.
     */
    struct Envelope
    {
        std::string event{};
        nlohmann::json data{};
    };

    /**
     * @brief Serializes an event into a text frame. Throws nlohmann::json::type_error on invalid UTF-8.
     */
    std::string encodeEnvelope(std::string_view event, nlohmann::json const& data);

    /**
     * @brief Parses a text frame. A missing "data" member is an empty object.
     */
    std::expected<Envelope, ChannelError> decodeEnvelope(std::string_view frame);
}
