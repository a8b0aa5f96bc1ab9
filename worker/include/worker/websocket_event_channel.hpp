#pragma once

#include <worker/event_channel.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <string>

namespace Worker
{
    struct WebSocketEventChannelOptions
    {
        std::string host{"127.0.0.1"};
        unsigned short port{5000};
        std::string target{"/events"};
    };

    /**
     * @brief EventChannel over a websocket. Every event is one JSON text frame. Writes are queued so that at most
     * one write is outstanding. There is no automatic reconnect.
     *
     * Must be owned by a std::shared_ptr, pending operations only hold weak references.
     */
    class WebSocketEventChannel
        : public EventChannel
        , public std::enable_shared_from_this<WebSocketEventChannel>
    {
      public:
        WebSocketEventChannel(boost::asio::any_io_executor executor, WebSocketEventChannelOptions options);
        ~WebSocketEventChannel() override;

        /**
         * @brief Resolves, connects and performs the websocket handshake.
         *
         * @param onConnected Called on the channel strand once the handshake completed or failed.
         */
        void connect(std::function<void(std::expected<void, ChannelError>)> onConnected = {});

        /**
         * @brief Sends a close frame. The connection handler is called once the socket is down.
         */
        void close();

        std::expected<void, ChannelError> emit(std::string_view event, nlohmann::json const& payload) override;
        void onEvent(EventHandler handler) override;
        void onConnectionChange(ConnectionHandler handler) override;
        bool isConnected() const override;

      private:
        void handshake(unsigned short port);
        void finishConnect(std::expected<void, ChannelError> result);
        void read();
        void write();
        void dispatchFrame(std::string const& frame);
        void setConnected(bool connected);

      private:
        struct Implementation;
        std::unique_ptr<Implementation> impl_;
    };
}
