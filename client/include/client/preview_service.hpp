#pragma once

#include <client/client_error.hpp>
#include <client/file_opener.hpp>
#include <worker/worker_api.hpp>

#include <expected>
#include <filesystem>
#include <functional>
#include <string>

namespace Client
{
    class OperationCoordinator;

    /**
     * @brief Pulls a remote file to a local temporary location and opens it there.
     */
    class PreviewService
    {
      public:
        using DoneCallback = std::function<void(std::expected<std::filesystem::path, ClientError>)>;

        PreviewService(Worker::WorkerApi& api, OperationCoordinator const& coordinator, FileOpener& opener);

        /**
         * @brief Refused for directories and while an operation runs.
         *
         * @param remotePath Absolute remote path of a file.
         * @param onDone Receives the local path the file was opened from.
         */
        void preview(std::string const& remotePath, DoneCallback onDone);

      private:
        Worker::WorkerApi* api_;
        OperationCoordinator const* coordinator_;
        FileOpener* opener_;
    };
}
