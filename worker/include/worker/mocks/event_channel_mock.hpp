#pragma once

#include <worker/event_channel.hpp>

#include <gmock/gmock.h>

namespace Worker::Test
{
    class EventChannelMock : public Worker::EventChannel
    {
      public:
        MOCK_METHOD(
            (std::expected<void, ChannelError>),
            emit,
            (std::string_view event, nlohmann::json const& payload),
            (override));
        MOCK_METHOD(void, onEvent, (EventHandler handler), (override));
        MOCK_METHOD(void, onConnectionChange, (ConnectionHandler handler), (override));
        MOCK_METHOD(bool, isConnected, (), (const, override));
    };
}
