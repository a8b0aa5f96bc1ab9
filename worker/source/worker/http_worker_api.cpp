#include <worker/http_worker_api.hpp>
#include <worker/reply_decoding.hpp>
#include <log/log.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <memory>

namespace Worker
{
    namespace beast = boost::beast;
    namespace http = boost::beast::http;
    using tcp = boost::asio::ip::tcp;

    namespace
    {
        std::string toStdString(beast::string_view view)
        {
            return std::string(view.data(), view.size());
        }

        /**
         * One request/response round trip. Keeps itself alive through the pending handlers.
         */
        class HttpExchange : public std::enable_shared_from_this<HttpExchange>
        {
          public:
            HttpExchange(
                boost::asio::any_io_executor executor,
                HttpWorkerApiOptions const& options,
                http::request<http::string_body> request,
                std::function<void(std::expected<nlohmann::json, ApiError>)> onResponse)
                : options_{options}
                , resolver_{executor}
                , stream_{executor}
                , buffer_{}
                , request_{std::move(request)}
                , response_{}
                , onResponse_{std::move(onResponse)}
            {}

            void run()
            {
                resolver_.async_resolve(
                    options_.host,
                    std::to_string(options_.port),
                    [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                        if (ec)
                            return self->fail(ec);

                        self->stream_.expires_after(self->options_.timeout);
                        self->stream_.async_connect(
                            results, [self](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                                if (ec)
                                    return self->fail(ec);
                                self->write();
                            });
                    });
            }

          private:
            void write()
            {
                stream_.expires_after(options_.timeout);
                http::async_write(stream_, request_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec)
                        return self->fail(ec);
                    self->read();
                });
            }

            void read()
            {
                http::async_read(
                    stream_, buffer_, response_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec)
                            return self->fail(ec);

                        beast::error_code shutdownError;
                        self->stream_.socket().shutdown(tcp::socket::shutdown_both, shutdownError);

                        Log::debug(
                            "Worker API {} {} -> {}",
                            toStdString(http::to_string(self->request_.method())),
                            toStdString(self->request_.target()),
                            self->response_.result_int());

                        self->onResponse_(interpretHttpResponse(self->response_.result_int(), self->response_.body()));
                    });
            }

            void fail(beast::error_code ec)
            {
                Log::error("Worker API request {} failed: {}", toStdString(request_.target()), ec.message());
                onResponse_(std::unexpected(ApiError{.type = ApiErrorType::ConnectionFailed, .extraInfo = ec.message()}));
            }

          private:
            HttpWorkerApiOptions options_;
            tcp::resolver resolver_;
            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            http::request<http::string_body> request_;
            http::response<http::string_body> response_;
            std::function<void(std::expected<nlohmann::json, ApiError>)> onResponse_;
        };

        template <typename T>
        std::function<void(std::expected<nlohmann::json, ApiError>)> plainReply(ApiCallback<T> onResult)
        {
            return [onResult = std::move(onResult)](std::expected<nlohmann::json, ApiError> response) {
                if (!response)
                    return onResult(std::unexpected(std::move(response).error()));
                onResult(decodePlainReply<T>(*response));
            };
        }

        template <typename T>
        std::function<void(std::expected<nlohmann::json, ApiError>)> errorOrSuccessReply(ApiCallback<T> onResult)
        {
            return [onResult = std::move(onResult)](std::expected<nlohmann::json, ApiError> response) {
                if (!response)
                    return onResult(std::unexpected(std::move(response).error()));
                onResult(decodeErrorOrSuccess<T>(*response));
            };
        }
    }

    HttpWorkerApi::HttpWorkerApi(boost::asio::any_io_executor executor, HttpWorkerApiOptions options)
        : executor_{std::move(executor)}
        , options_{std::move(options)}
    {}

    void HttpWorkerApi::request(
        http::verb verb,
        std::string target,
        std::optional<nlohmann::json> body,
        std::function<void(std::expected<nlohmann::json, ApiError>)> onResponse)
    {
        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, options_.host + ":" + std::to_string(options_.port));
        req.set(http::field::user_agent, "courier");
        req.set(http::field::accept, "application/json");
        if (body)
        {
            req.set(http::field::content_type, "application/json");
            req.body() = body->dump();
        }
        req.prepare_payload();

        std::make_shared<HttpExchange>(executor_, options_, std::move(req), std::move(onResponse))->run();
    }

    void HttpWorkerApi::status(ApiCallback<SharedData::WorkerStatus> onResult)
    {
        request(http::verb::get, "/api/status", std::nullopt, plainReply(std::move(onResult)));
    }

    void HttpWorkerApi::listPath(
        std::string const& path,
        ApiCallback<std::vector<SharedData::DirectoryEntry>> onResult)
    {
        request(http::verb::post, "/api/list_path", nlohmann::json{{"path", path}}, plainReply(std::move(onResult)));
    }

    void HttpWorkerApi::previewFile(std::string const& path, ApiCallback<SharedData::PreviewFile> onResult)
    {
        request(
            http::verb::post,
            "/api/preview_file",
            nlohmann::json{{"path", path}},
            errorOrSuccessReply(std::move(onResult)));
    }

    void HttpWorkerApi::createAccount(
        std::string const& userId,
        std::string const& plan,
        ApiCallback<SharedData::Message> onResult)
    {
        request(
            http::verb::post,
            "/api/create_account",
            nlohmann::json{{"user_id", userId}, {"plan", plan}},
            errorOrSuccessReply(std::move(onResult)));
    }

    void HttpWorkerApi::login(std::string const& userId, ApiCallback<SharedData::Login> onResult)
    {
        request(
            http::verb::post,
            "/api/login",
            nlohmann::json{{"user_id", userId}},
            errorOrSuccessReply(std::move(onResult)));
    }

    void HttpWorkerApi::adminUsers(ApiCallback<std::vector<SharedData::AccountInfo>> onResult)
    {
        request(http::verb::get, "/api/admin_users", std::nullopt, plainReply(std::move(onResult)));
    }

    void HttpWorkerApi::adminDeleteUser(std::string const& userId, ApiCallback<SharedData::Message> onResult)
    {
        request(
            http::verb::post,
            "/api/admin_delete_user",
            nlohmann::json{{"user_id", userId}},
            errorOrSuccessReply(std::move(onResult)));
    }
}
