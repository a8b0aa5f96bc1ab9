#pragma once

#include <fmt/format.h>

#include <optional>
#include <string>

namespace Worker
{
    enum class ChannelErrorType
    {
        NotConnected,
        ResolveFailed,
        ConnectFailed,
        HandshakeFailed,
        WriteFailed,
        ReadFailed,
        Closed,
        SerializationFailed
    };

    inline std::string toString(ChannelErrorType type)
    {
        switch (type)
        {
            case ChannelErrorType::NotConnected:
                return "NotConnected";
            case ChannelErrorType::ResolveFailed:
                return "ResolveFailed";
            case ChannelErrorType::ConnectFailed:
                return "ConnectFailed";
            case ChannelErrorType::HandshakeFailed:
                return "HandshakeFailed";
            case ChannelErrorType::WriteFailed:
                return "WriteFailed";
            case ChannelErrorType::ReadFailed:
                return "ReadFailed";
            case ChannelErrorType::Closed:
                return "Closed";
            case ChannelErrorType::SerializationFailed:
                return "SerializationFailed";
        }
        return "INVALID_ENUM_VALUE";
    }

    struct ChannelError
    {
        ChannelErrorType type;
        std::optional<std::string> extraInfo = std::nullopt;

        std::string toString() const
        {
            if (extraInfo)
                return fmt::format("{}: {}.", Worker::toString(type), *extraInfo);
            return Worker::toString(type);
        }
    };
}
