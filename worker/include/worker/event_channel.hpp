#pragma once

#include <worker/channel_error.hpp>

#include <nlohmann/json.hpp>

#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace Worker
{
    /**
     * @brief Persistent duplex channel to the worker carrying named events with JSON payloads.
     * Events are delivered in the order the worker sent them.
     */
    class EventChannel
    {
      public:
        using EventHandler = std::function<void(std::string const& event, nlohmann::json const& payload)>;
        using ConnectionHandler = std::function<void(bool connected)>;

        EventChannel() = default;
        virtual ~EventChannel() = default;
        EventChannel(EventChannel const&) = delete;
        EventChannel& operator=(EventChannel const&) = delete;
        EventChannel(EventChannel&&) = delete;
        EventChannel& operator=(EventChannel&&) = delete;

        /**
         * @brief Queues an event for sending. Fails immediately if the channel is not connected.
         *
         * @param event Event name, e.g. "start_operation".
         * @param payload Event data.
         * @return std::expected<void, ChannelError> Success means the event was accepted for sending.
         */
        virtual std::expected<void, ChannelError> emit(std::string_view event, nlohmann::json const& payload) = 0;

        /**
         * @brief Installs the handler for inbound events. Replaces any previous handler.
         */
        virtual void onEvent(EventHandler handler) = 0;

        /**
         * @brief Installs the handler for connection state changes. Replaces any previous handler.
         */
        virtual void onConnectionChange(ConnectionHandler handler) = 0;

        virtual bool isConnected() const = 0;
    };
}
