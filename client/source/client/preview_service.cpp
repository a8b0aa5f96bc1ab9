#include <client/preview_service.hpp>
#include <client/operation_coordinator.hpp>
#include <log/log.hpp>

namespace Client
{
    PreviewService::PreviewService(Worker::WorkerApi& api, OperationCoordinator const& coordinator, FileOpener& opener)
        : api_{&api}
        , coordinator_{&coordinator}
        , opener_{&opener}
    {}

    void PreviewService::preview(std::string const& remotePath, DoneCallback onDone)
    {
        if (!coordinator_->isIdle())
            return onDone(std::unexpected(ClientError{
                .type = ClientErrorType::NotIdle,
                .extraInfo = "Preview is disabled while an operation runs",
            }));

        if (remotePath.empty() || remotePath.back() == '/')
            return onDone(std::unexpected(ClientError{
                .type = ClientErrorType::InvalidRequest,
                .extraInfo = "Only files can be previewed",
            }));

        Log::info("Fetching '{}' for preview.", remotePath);
        api_->previewFile(
            remotePath,
            [this, remotePath, onDone = std::move(onDone)](
                std::expected<SharedData::PreviewFile, Worker::ApiError> preview) {
                if (!preview)
                {
                    Log::error("Preview of '{}' failed: {}", remotePath, preview.error().toString());
                    return onDone(std::unexpected(
                        ClientError{.type = ClientErrorType::ApiFailure, .extraInfo = preview.error().userMessage()}));
                }

                const std::filesystem::path localPath{preview->localPath};
                if (auto opened = opener_->open(localPath); !opened)
                {
                    Log::error("Opening '{}' failed: {}", localPath.string(), opened.error().toString());
                    return onDone(std::unexpected(std::move(opened).error()));
                }
                onDone(localPath);
            });
    }
}
