#pragma once

#include <worker/api_error.hpp>
#include <shared_data/account_info.hpp>
#include <shared_data/directory_entry.hpp>
#include <shared_data/error_or_success.hpp>
#include <shared_data/login.hpp>
#include <shared_data/preview_file.hpp>
#include <shared_data/worker_status.hpp>

#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace Worker
{
    template <typename T>
    using ApiCallback = std::function<void(std::expected<T, ApiError>)>;

    /**
     * @brief Request/response calls to the worker that do not travel over the event channel.
     * Callbacks are invoked on the io thread. Replies with "success": false arrive as ApiErrorType::WorkerError.
     */
    class WorkerApi
    {
      public:
        WorkerApi() = default;
        virtual ~WorkerApi() = default;
        WorkerApi(WorkerApi const&) = delete;
        WorkerApi& operator=(WorkerApi const&) = delete;
        WorkerApi(WorkerApi&&) = delete;
        WorkerApi& operator=(WorkerApi&&) = delete;

        /**
         * @brief Is a phone attached and usable?
         */
        virtual void status(ApiCallback<SharedData::WorkerStatus> onResult) = 0;

        /**
         * @brief Lists a remote directory.
         *
         * @param path Absolute remote directory, with trailing slash.
         */
        virtual void listPath(std::string const& path, ApiCallback<std::vector<SharedData::DirectoryEntry>> onResult) = 0;

        /**
         * @brief Copies a remote file into a local temporary location.
         */
        virtual void previewFile(std::string const& path, ApiCallback<SharedData::PreviewFile> onResult) = 0;

        virtual void createAccount(
            std::string const& userId,
            std::string const& plan,
            ApiCallback<SharedData::Message> onResult) = 0;

        virtual void login(std::string const& userId, ApiCallback<SharedData::Login> onResult) = 0;

        virtual void adminUsers(ApiCallback<std::vector<SharedData::AccountInfo>> onResult) = 0;

        virtual void adminDeleteUser(std::string const& userId, ApiCallback<SharedData::Message> onResult) = 0;
    };
}
