#include <worker/envelope.hpp>

namespace Worker
{
    std::string encodeEnvelope(std::string_view event, nlohmann::json const& data)
    {
        return nlohmann::json{
            {"event", std::string{event}},
            {"data", data},
        }
            .dump();
    }

    std::expected<Envelope, ChannelError> decodeEnvelope(std::string_view frame)
    {
        nlohmann::json json;
        try
        {
            json = nlohmann::json::parse(frame);
        }
        catch (nlohmann::json::parse_error const& e)
        {
            return std::unexpected(ChannelError{.type = ChannelErrorType::ReadFailed, .extraInfo = e.what()});
        }

        if (!json.is_object())
            return std::unexpected(
                ChannelError{.type = ChannelErrorType::ReadFailed, .extraInfo = "Frame is not a JSON object"});

        const auto event = json.find("event");
        if (event == json.end() || !event->is_string())
            return std::unexpected(
                ChannelError{.type = ChannelErrorType::ReadFailed, .extraInfo = "Frame carries no event name"});

        Envelope envelope{.event = event->get<std::string>(), .data = nlohmann::json::object()};
        if (const auto data = json.find("data"); data != json.end() && !data->is_null())
            envelope.data = *data;

        return envelope;
    }
}
