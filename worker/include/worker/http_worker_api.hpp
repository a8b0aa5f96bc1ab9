#pragma once

#include <worker/worker_api.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace Worker
{
    struct HttpWorkerApiOptions
    {
        std::string host{"127.0.0.1"};
        unsigned short port{5000};
        std::chrono::seconds timeout{60};
    };

    /**
     * @brief WorkerApi over plain HTTP/1.1 with one connection per request.
     */
    class HttpWorkerApi : public WorkerApi
    {
      public:
        HttpWorkerApi(boost::asio::any_io_executor executor, HttpWorkerApiOptions options);

        void status(ApiCallback<SharedData::WorkerStatus> onResult) override;
        void listPath(std::string const& path, ApiCallback<std::vector<SharedData::DirectoryEntry>> onResult) override;
        void previewFile(std::string const& path, ApiCallback<SharedData::PreviewFile> onResult) override;
        void createAccount(
            std::string const& userId,
            std::string const& plan,
            ApiCallback<SharedData::Message> onResult) override;
        void login(std::string const& userId, ApiCallback<SharedData::Login> onResult) override;
        void adminUsers(ApiCallback<std::vector<SharedData::AccountInfo>> onResult) override;
        void adminDeleteUser(std::string const& userId, ApiCallback<SharedData::Message> onResult) override;

      private:
        void request(
            boost::beast::http::verb verb,
            std::string target,
            std::optional<nlohmann::json> body,
            std::function<void(std::expected<nlohmann::json, ApiError>)> onResponse);

      private:
        boost::asio::any_io_executor executor_;
        HttpWorkerApiOptions options_;
    };
}
