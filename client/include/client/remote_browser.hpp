#pragma once

#include <client/client_error.hpp>
#include <shared_data/directory_entry.hpp>
#include <shared_data/worker_status.hpp>
#include <worker/worker_api.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Client
{
    class OperationCoordinator;

    /**
     * @brief The remote directory the operator is looking at. Never leaves the root directory upwards.
     */
    class RemoteBrowser
    {
      public:
        using DoneCallback = std::function<void(std::expected<void, ClientError>)>;

        RemoteBrowser(Worker::WorkerApi& api, OperationCoordinator const& coordinator, std::string rootPath);

        /**
         * @brief Checks the worker status and reloads the listing if the phone is usable.
         * Otherwise the listing is cleared. Replies to an older refresh are discarded.
         */
        void refresh(DoneCallback onDone);

        /**
         * @brief Descends into a directory of the current listing and refreshes.
         *
         * @param name Entry name as listed, with trailing slash.
         */
        void enter(std::string const& name, DoneCallback onDone);

        /**
         * @brief Goes to the parent directory and refreshes.
         */
        void up(DoneCallback onDone);

        /**
         * @brief Remote path of an entry in the current directory.
         */
        std::string pathOf(std::string const& name) const;

        std::string const& currentPath() const;
        std::string const& rootPath() const;
        std::vector<SharedData::DirectoryEntry> const& entries() const;
        std::optional<SharedData::WorkerStatus> const& status() const;

      private:
        std::expected<void, ClientError> navigationAllowed() const;
        void clearListing();

      private:
        Worker::WorkerApi* api_;
        OperationCoordinator const* coordinator_;
        std::string rootPath_;
        std::string currentPath_;
        std::vector<SharedData::DirectoryEntry> entries_;
        std::optional<SharedData::WorkerStatus> status_;
        std::uint64_t refreshGeneration_;
    };
}
