#include <worker/websocket_event_channel.hpp>
#include <worker/envelope.hpp>
#include <log/log.hpp>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <chrono>
#include <deque>

namespace Worker
{
    namespace beast = boost::beast;
    namespace websocket = boost::beast::websocket;
    using tcp = boost::asio::ip::tcp;

    namespace
    {
        constexpr auto connectTimeout = std::chrono::seconds{30};
    }

    struct WebSocketEventChannel::Implementation
    {
        WebSocketEventChannelOptions options;
        boost::asio::strand<boost::asio::any_io_executor> strand;
        tcp::resolver resolver;
        // Recreated for every connection attempt, a closed websocket stream cannot be reused.
        std::unique_ptr<websocket::stream<beast::tcp_stream>> stream;
        beast::flat_buffer readBuffer;
        std::deque<std::string> writeQueue;
        bool writing;
        bool connecting;
        std::atomic_bool connected;
        std::function<void(std::expected<void, ChannelError>)> pendingConnect;
        EventHandler eventHandler;
        ConnectionHandler connectionHandler;

        Implementation(boost::asio::any_io_executor executor, WebSocketEventChannelOptions options)
            : options{std::move(options)}
            , strand{boost::asio::make_strand(executor)}
            , resolver{strand}
            , stream{}
            , readBuffer{}
            , writeQueue{}
            , writing{false}
            , connecting{false}
            , connected{false}
            , pendingConnect{}
            , eventHandler{}
            , connectionHandler{}
        {}
    };

    WebSocketEventChannel::WebSocketEventChannel(
        boost::asio::any_io_executor executor,
        WebSocketEventChannelOptions options)
        : impl_{std::make_unique<Implementation>(std::move(executor), std::move(options))}
    {}

    WebSocketEventChannel::~WebSocketEventChannel() = default;

    void WebSocketEventChannel::connect(std::function<void(std::expected<void, ChannelError>)> onConnected)
    {
        boost::asio::dispatch(
            impl_->strand, [weak = weak_from_this(), onConnected = std::move(onConnected)]() mutable {
                auto self = weak.lock();
                if (!self)
                    return;

                auto& impl = *self->impl_;
                if (impl.connected)
                {
                    if (onConnected)
                        onConnected({});
                    return;
                }

                if (impl.connecting)
                {
                    if (onConnected)
                        onConnected(std::unexpected(ChannelError{
                            .type = ChannelErrorType::ConnectFailed, .extraInfo = "Connect already in progress"}));
                    return;
                }

                impl.connecting = true;
                impl.pendingConnect = std::move(onConnected);
                impl.stream = std::make_unique<websocket::stream<beast::tcp_stream>>(impl.strand);
                impl.readBuffer.clear();
                Log::info(
                    "Connecting to worker event channel at ws://{}:{}{}",
                    impl.options.host,
                    impl.options.port,
                    impl.options.target);

                impl.resolver.async_resolve(
                    impl.options.host,
                    std::to_string(impl.options.port),
                    [weak](beast::error_code ec, tcp::resolver::results_type results) {
                        auto self = weak.lock();
                        if (!self)
                            return;

                        if (ec)
                            return self->finishConnect(std::unexpected(
                                ChannelError{.type = ChannelErrorType::ResolveFailed, .extraInfo = ec.message()}));

                        auto& lowest = beast::get_lowest_layer(*self->impl_->stream);
                        lowest.expires_after(connectTimeout);
                        lowest.async_connect(
                            results, [weak](beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
                                auto self = weak.lock();
                                if (!self)
                                    return;

                                if (ec)
                                    return self->finishConnect(std::unexpected(ChannelError{
                                        .type = ChannelErrorType::ConnectFailed, .extraInfo = ec.message()}));

                                self->handshake(endpoint.port());
                            });
                    });
            });
    }

    void WebSocketEventChannel::handshake(unsigned short port)
    {
        auto& impl = *impl_;

        beast::get_lowest_layer(*impl.stream).expires_never();
        impl.stream->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        impl.stream->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "courier");
        }));

        impl.stream->async_handshake(
            impl.options.host + ":" + std::to_string(port),
            impl.options.target,
            [weak = weak_from_this()](beast::error_code ec) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (ec)
                    return self->finishConnect(std::unexpected(
                        ChannelError{.type = ChannelErrorType::HandshakeFailed, .extraInfo = ec.message()}));

                self->impl_->stream->text(true);
                self->setConnected(true);
                self->finishConnect({});
                self->read();
            });
    }

    void WebSocketEventChannel::finishConnect(std::expected<void, ChannelError> result)
    {
        impl_->connecting = false;
        if (!result)
            Log::error("Worker event channel: {}", result.error().toString());
        else
            Log::info("Worker event channel connected.");

        auto pending = std::move(impl_->pendingConnect);
        impl_->pendingConnect = {};
        if (pending)
            pending(std::move(result));
    }

    void WebSocketEventChannel::close()
    {
        boost::asio::dispatch(impl_->strand, [weak = weak_from_this()]() {
            auto self = weak.lock();
            if (!self || !self->impl_->connected)
                return;

            Log::info("Closing worker event channel.");
            self->impl_->stream->async_close(websocket::close_code::normal, [weak](beast::error_code ec) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (ec)
                    Log::warn("Worker event channel did not close cleanly: {}", ec.message());
                self->setConnected(false);
            });
        });
    }

    std::expected<void, ChannelError> WebSocketEventChannel::emit(std::string_view event, nlohmann::json const& payload)
    {
        if (!impl_->connected)
            return std::unexpected(ChannelError{.type = ChannelErrorType::NotConnected});

        std::string frame;
        try
        {
            frame = encodeEnvelope(event, payload);
        }
        catch (nlohmann::json::exception const& e)
        {
            return std::unexpected(ChannelError{.type = ChannelErrorType::SerializationFailed, .extraInfo = e.what()});
        }

        Log::debug("Worker event channel: emitting '{}'.", event);
        boost::asio::post(impl_->strand, [weak = weak_from_this(), frame = std::move(frame)]() mutable {
            auto self = weak.lock();
            if (!self)
                return;

            self->impl_->writeQueue.push_back(std::move(frame));
            if (!self->impl_->writing)
                self->write();
        });
        return {};
    }

    void WebSocketEventChannel::onEvent(EventHandler handler)
    {
        boost::asio::dispatch(impl_->strand, [weak = weak_from_this(), handler = std::move(handler)]() mutable {
            if (auto self = weak.lock(); self)
                self->impl_->eventHandler = std::move(handler);
        });
    }

    void WebSocketEventChannel::onConnectionChange(ConnectionHandler handler)
    {
        boost::asio::dispatch(impl_->strand, [weak = weak_from_this(), handler = std::move(handler)]() mutable {
            if (auto self = weak.lock(); self)
                self->impl_->connectionHandler = std::move(handler);
        });
    }

    bool WebSocketEventChannel::isConnected() const
    {
        return impl_->connected;
    }

    void WebSocketEventChannel::read()
    {
        impl_->stream->async_read(
            impl_->readBuffer, [weak = weak_from_this()](beast::error_code ec, std::size_t) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (ec)
                {
                    if (ec == websocket::error::closed)
                        Log::info("Worker closed the event channel.");
                    else if (ec != boost::asio::error::operation_aborted)
                        Log::error("Worker event channel read failed: {}", ec.message());
                    self->setConnected(false);
                    return;
                }

                auto& buffer = self->impl_->readBuffer;
                const auto frame = beast::buffers_to_string(buffer.data());
                buffer.consume(buffer.size());

                self->dispatchFrame(frame);
                self->read();
            });
    }

    void WebSocketEventChannel::write()
    {
        auto& impl = *impl_;
        if (impl.writeQueue.empty() || !impl.connected)
        {
            impl.writing = false;
            return;
        }

        impl.writing = true;
        impl.stream->async_write(
            boost::asio::buffer(impl.writeQueue.front()), [weak = weak_from_this()](beast::error_code ec, std::size_t) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (ec)
                {
                    Log::error(
                        "Worker event channel write failed, dropping {} queued events: {}",
                        self->impl_->writeQueue.size(),
                        ec.message());
                    self->impl_->writeQueue.clear();
                    self->impl_->writing = false;
                    self->setConnected(false);
                    return;
                }

                self->impl_->writeQueue.pop_front();
                self->write();
            });
    }

    void WebSocketEventChannel::dispatchFrame(std::string const& frame)
    {
        auto envelope = decodeEnvelope(frame);
        if (!envelope)
        {
            Log::error("Dropping malformed frame from worker: {}", envelope.error().toString());
            return;
        }

        Log::trace("Worker event channel: received '{}'.", envelope->event);
        if (impl_->eventHandler)
            impl_->eventHandler(envelope->event, envelope->data);
    }

    void WebSocketEventChannel::setConnected(bool connected)
    {
        if (impl_->connected.exchange(connected) == connected)
            return;

        if (!connected)
        {
            impl_->writeQueue.clear();
            impl_->writing = false;
        }

        if (impl_->connectionHandler)
            impl_->connectionHandler(connected);
    }
}
