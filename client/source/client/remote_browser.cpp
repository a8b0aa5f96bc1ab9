#include <client/remote_browser.hpp>
#include <client/operation_coordinator.hpp>
#include <log/log.hpp>

#include <algorithm>

namespace Client
{
    namespace
    {
        std::string withTrailingSlash(std::string path)
        {
            if (path.empty() || path.back() != '/')
                path.push_back('/');
            return path;
        }
    }

    RemoteBrowser::RemoteBrowser(Worker::WorkerApi& api, OperationCoordinator const& coordinator, std::string rootPath)
        : api_{&api}
        , coordinator_{&coordinator}
        , rootPath_{withTrailingSlash(std::move(rootPath))}
        , currentPath_{rootPath_}
        , entries_{}
        , status_{}
        , refreshGeneration_{0}
    {}

    void RemoteBrowser::refresh(DoneCallback onDone)
    {
        const auto generation = ++refreshGeneration_;

        api_->status([this, generation, onDone = std::move(onDone)](
                         std::expected<SharedData::WorkerStatus, Worker::ApiError> status) mutable {
            if (generation != refreshGeneration_)
                return;

            if (!status)
            {
                Log::error("Worker status check failed: {}", status.error().toString());
                status_ = SharedData::WorkerStatus{
                    .level = SharedData::WorkerStatusLevel::Error,
                    .message = "Error connecting to backend.",
                };
                clearListing();
                return onDone(std::unexpected(
                    ClientError{.type = ClientErrorType::ApiFailure, .extraInfo = status.error().userMessage()}));
            }

            status_ = *status;
            if (!status->usable())
            {
                Log::warn("Worker status: {}", status->message);
                clearListing();
                return onDone({});
            }

            api_->listPath(
                currentPath_,
                [this, generation, onDone = std::move(onDone)](
                    std::expected<std::vector<SharedData::DirectoryEntry>, Worker::ApiError> listing) {
                    if (generation != refreshGeneration_)
                        return;

                    if (!listing)
                    {
                        Log::error("Listing '{}' failed: {}", currentPath_, listing.error().toString());
                        clearListing();
                        return onDone(std::unexpected(ClientError{
                            .type = ClientErrorType::ApiFailure, .extraInfo = listing.error().userMessage()}));
                    }

                    entries_ = std::move(*listing);
                    Log::debug("Listed {} entries in '{}'.", entries_.size(), currentPath_);
                    onDone({});
                });
        });
    }

    void RemoteBrowser::enter(std::string const& name, DoneCallback onDone)
    {
        if (auto allowed = navigationAllowed(); !allowed)
            return onDone(std::move(allowed));

        const auto entry = std::find_if(entries_.begin(), entries_.end(), [&name](auto const& candidate) {
            return candidate.name == name;
        });
        if (entry == entries_.end() || !entry->isDirectory)
            return onDone(std::unexpected(ClientError{
                .type = ClientErrorType::InvalidRequest,
                .extraInfo = "'" + name + "' is not a directory here",
            }));

        currentPath_ = withTrailingSlash(currentPath_ + name);
        refresh(std::move(onDone));
    }

    void RemoteBrowser::up(DoneCallback onDone)
    {
        if (auto allowed = navigationAllowed(); !allowed)
            return onDone(std::move(allowed));

        if (currentPath_ == rootPath_)
            return onDone(std::unexpected(
                ClientError{.type = ClientErrorType::InvalidRequest, .extraInfo = "Already at the top directory"}));

        const auto withoutSlash = currentPath_.substr(0, currentPath_.size() - 1);
        auto parent = withoutSlash.substr(0, withoutSlash.find_last_of('/') + 1);
        if (parent.size() < rootPath_.size() || !parent.starts_with(rootPath_))
            parent = rootPath_;

        currentPath_ = std::move(parent);
        refresh(std::move(onDone));
    }

    std::string RemoteBrowser::pathOf(std::string const& name) const
    {
        return currentPath_ + name;
    }

    std::string const& RemoteBrowser::currentPath() const
    {
        return currentPath_;
    }

    std::string const& RemoteBrowser::rootPath() const
    {
        return rootPath_;
    }

    std::vector<SharedData::DirectoryEntry> const& RemoteBrowser::entries() const
    {
        return entries_;
    }

    std::optional<SharedData::WorkerStatus> const& RemoteBrowser::status() const
    {
        return status_;
    }

    std::expected<void, ClientError> RemoteBrowser::navigationAllowed() const
    {
        if (!coordinator_->isIdle())
            return std::unexpected(ClientError{
                .type = ClientErrorType::NotIdle,
                .extraInfo = "Navigation is disabled while an operation runs",
            });
        return {};
    }

    void RemoteBrowser::clearListing()
    {
        entries_.clear();
    }
}
