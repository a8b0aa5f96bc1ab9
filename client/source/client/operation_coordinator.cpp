#include <client/operation_coordinator.hpp>
#include <shared_data/events.hpp>
#include <shared_data/file_operations/conflict_batch.hpp>
#include <shared_data/file_operations/conflict_resolution.hpp>
#include <shared_data/file_operations/duplicate_scan_result.hpp>
#include <shared_data/file_operations/progress_update.hpp>
#include <shared_data/log_message.hpp>
#include <log/log.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace Client
{
    namespace
    {
        template <typename T>
        std::expected<T, ClientError> decodeEvent(std::string_view event, nlohmann::json const& payload)
        {
            try
            {
                return payload.get<T>();
            }
            catch (std::exception const& e)
            {
                return std::unexpected(ClientError{
                    .type = ClientErrorType::ProtocolViolation,
                    .extraInfo = fmt::format("Malformed '{}' event: {}", event, e.what()),
                });
            }
        }

        bool needsDestination(SharedData::OperationKind kind)
        {
            using enum SharedData::OperationKind;
            return kind == Copy || kind == Move || kind == CloudRestore;
        }
    }

    std::string toString(CoordinatorState state)
    {
        switch (state)
        {
            case CoordinatorState::Idle:
                return "Idle";
            case CoordinatorState::Busy:
                return "Busy";
            case CoordinatorState::AwaitingConflictDecision:
                return "AwaitingConflictDecision";
            case CoordinatorState::Cancelling:
                return "Cancelling";
        }
        return "INVALID_ENUM_VALUE";
    }

    OperationCoordinator::OperationCoordinator(Worker::EventChannel& channel, ControlSurface& surface)
        : channel_{&channel}
        , surface_{&surface}
        , state_{CoordinatorState::Idle}
        , session_{}
        , conflictSession_{}
        , duplicateScan_{}
        , lastSummary_{}
        , destinationPath_{}
        , authenticatedUser_{}
    {}

    template <typename T>
    std::expected<T, ClientError> OperationCoordinator::reject(ClientError error, Severity severity)
    {
        if (error.type == ClientErrorType::ProtocolViolation)
            Log::error("Protocol violation in state {}: {}", toString(state_), error.toString());
        else
            Log::warn("Rejected: {}", error.toString());

        surface_->notify(severity, error.userMessage());
        return std::unexpected(std::move(error));
    }

    std::expected<Ids::OperationId, ClientError> OperationCoordinator::start(SharedData::OperationRequest request)
    {
        using enum SharedData::OperationKind;

        if (state_ != CoordinatorState::Idle)
            return reject<Ids::OperationId>(
                ClientError{.type = ClientErrorType::NotIdle, .extraInfo = "Another operation is already running"},
                Severity::Warning);

        if (request.sourcePaths.empty() && request.kind != CloudRestore)
            return reject<Ids::OperationId>(
                ClientError{
                    .type = ClientErrorType::InvalidRequest,
                    .extraInfo = fmt::format(
                        "Select at least one file or folder to {}",
                        SharedData::toDisplayString(request.kind)),
                },
                Severity::Warning);

        if (needsDestination(request.kind) && request.destinationPath.empty())
            return reject<Ids::OperationId>(
                ClientError{.type = ClientErrorType::InvalidRequest, .extraInfo = "Select a destination folder first"},
                Severity::Warning);

        if (SharedData::isCloudOperation(request.kind) && (!request.userId || request.userId->empty()))
            return reject<Ids::OperationId>(
                ClientError{.type = ClientErrorType::NotAuthenticated, .extraInfo = "Please log in first"},
                Severity::Warning);

        if (auto emitted = channel_->emit(SharedData::Events::startOperation, nlohmann::json(request)); !emitted)
            return reject<Ids::OperationId>(ClientError{
                .type = ClientErrorType::ChannelFailure,
                .extraInfo = fmt::format("Could not reach the worker: {}", emitted.error().toString()),
            });

        session_ = OperationSession{
            .id = Ids::generateOperationId(),
            .request = std::move(request),
        };
        lastSummary_ = std::nullopt;

        Log::info(
            "Operation {} started: {} of {} path(s) to '{}'.",
            session_->id.shortValue(),
            SharedData::toDisplayString(session_->request.kind),
            session_->request.sourcePaths.size(),
            session_->request.destinationPath);

        enterState(CoordinatorState::Busy);
        surface_->showProgress(0, 0);
        surface_->notify(
            Severity::Info, fmt::format("{} started.", SharedData::toDisplayString(session_->request.kind)));
        return session_->id;
    }

    SharedData::OperationRequest
    OperationCoordinator::makeRequest(SharedData::OperationKind kind, std::vector<std::string> paths) const
    {
        return SharedData::OperationRequest{
            .kind = kind,
            .sourcePaths = std::move(paths),
            .destinationPath = destinationPath_,
            .userId = authenticatedUser_,
        };
    }

    std::expected<void, ClientError>
    OperationCoordinator::onChannelEvent(std::string const& event, nlohmann::json const& payload)
    {
        namespace Events = SharedData::Events;

        if (event == Events::progressUpdate)
            return onProgress(payload);
        if (event == Events::logMessage)
            return onLogMessage(payload);
        if (event == Events::operationComplete)
            return onOperationComplete(payload);
        if (event == Events::operationCancelled)
            return onOperationCancelled();
        if (event == Events::scanComplete)
            return onScanComplete(payload);
        if (event == Events::askForOverwrite)
            return onAskForOverwrite(payload);

        Log::warn("Ignoring unknown worker event '{}'.", event);
        return {};
    }

    void OperationCoordinator::onConnectionChange(bool connected)
    {
        if (connected)
        {
            Log::info("Worker connection established.");
            return;
        }

        if (state_ == CoordinatorState::Idle)
        {
            Log::warn("Worker connection lost.");
            surface_->notify(Severity::Warning, "Connection to the worker lost.");
            return;
        }

        Log::error("Worker connection lost while {}.", toString(state_));
        surface_->notify(
            Severity::Error, "Connection to the worker lost. The running operation can no longer be tracked.");
    }

    std::expected<void, ClientError> OperationCoordinator::onProgress(nlohmann::json const& payload)
    {
        auto progress = decodeEvent<SharedData::ProgressUpdate>(SharedData::Events::progressUpdate, payload);
        if (!progress)
            return reject(std::move(progress).error());

        if (state_ == CoordinatorState::Idle || !session_)
        {
            Log::trace("Dropping progress {}/{} while idle.", progress->current, progress->total);
            return {};
        }

        session_->progressCurrent = progress->current;
        session_->progressTotal = progress->total;
        surface_->showProgress(progress->clampedCurrent(), progress->total);
        return {};
    }

    std::expected<void, ClientError> OperationCoordinator::onLogMessage(nlohmann::json const& payload)
    {
        auto message = decodeEvent<SharedData::LogMessage>(SharedData::Events::logMessage, payload);
        if (!message)
            return reject(std::move(message).error());

        Log::log(Log::levelFromWorkerTag(message->type), "[WORKER] {}", message->data);
        surface_->appendWorkerLog(message->type, message->data);
        return {};
    }

    std::expected<void, ClientError> OperationCoordinator::onOperationComplete(nlohmann::json const& payload)
    {
        auto summary = decodeEvent<SharedData::OperationSummary>(SharedData::Events::operationComplete, payload);
        if (!summary)
            return reject(std::move(summary).error());

        const auto tally = fmt::format(
            "{} complete: {} succeeded, {} failed.",
            SharedData::toDisplayString(summary->kind),
            summary->succeededCount,
            summary->failedCount);

        switch (state_)
        {
            case CoordinatorState::Idle:
                Log::info("Ignoring completion report while idle: {}", tally);
                return {};
            case CoordinatorState::Cancelling:
                Log::info("Worker reported before acknowledging the cancel: {}", tally);
                surface_->notify(Severity::Info, tally);
                return {};
            case CoordinatorState::AwaitingConflictDecision:
                Log::warn("Operation completed while conflicts were still open, discarding the conflict session.");
                discardConflictSession();
                break;
            case CoordinatorState::Busy:
                break;
        }

        if (session_ && session_->request.kind != summary->kind)
            Log::warn(
                "Completion reports {} but the running operation is {}.",
                SharedData::toDisplayString(summary->kind),
                SharedData::toDisplayString(session_->request.kind));

        Log::info("Operation {}: {}", session_ ? session_->id.shortValue() : std::string{"?"}, tally);
        lastSummary_ = *summary;
        surface_->notify(summary->failedCount == 0 ? Severity::Success : Severity::Warning, tally);

        enterIdle();

        if (summary->kind == SharedData::OperationKind::Move && summary->succeededCount > 0)
            surface_->requestListingRefresh();
        return {};
    }

    std::expected<void, ClientError> OperationCoordinator::onOperationCancelled()
    {
        switch (state_)
        {
            case CoordinatorState::Idle:
                Log::debug("Ignoring cancel acknowledgment while idle.");
                return {};
            case CoordinatorState::Cancelling:
                break;
            case CoordinatorState::Busy:
            case CoordinatorState::AwaitingConflictDecision:
                Log::warn("Worker cancelled the operation on its own.");
                discardConflictSession();
                break;
        }

        Log::info("Operation {} cancelled.", session_ ? session_->id.shortValue() : std::string{"?"});
        enterIdle();
        surface_->showProgress(0, 0);
        surface_->notify(Severity::Info, "Operation cancelled.");
        return {};
    }

    std::expected<void, ClientError> OperationCoordinator::onScanComplete(nlohmann::json const& payload)
    {
        auto result = decodeEvent<SharedData::DuplicateScanResult>(SharedData::Events::scanComplete, payload);
        if (!result)
            return reject(std::move(result).error());

        if (state_ != CoordinatorState::Busy)
        {
            Log::info("Ignoring scan result while {}.", toString(state_));
            return {};
        }

        if (session_ && session_->request.kind != SharedData::OperationKind::FindDuplicates)
            return reject(ClientError{
                .type = ClientErrorType::ProtocolViolation,
                .extraInfo = fmt::format(
                    "Worker sent a scan result during {}", SharedData::toDisplayString(session_->request.kind)),
            });

        duplicateScan_.emplace(std::move(*result));
        Log::info(
            "Duplicate scan finished: {} unique file(s), {} duplicate group(s).",
            duplicateScan_->result().uniqueFiles.size(),
            duplicateScan_->groupCount());

        enterIdle();
        surface_->showProgress(0, 0);
        surface_->notify(
            Severity::Success,
            fmt::format(
                "Scan complete: {} unique file(s), {} group(s) of duplicates.",
                duplicateScan_->result().uniqueFiles.size(),
                duplicateScan_->groupCount()));
        surface_->showDuplicateScanResult(*duplicateScan_);
        return {};
    }

    std::expected<void, ClientError> OperationCoordinator::onAskForOverwrite(nlohmann::json const& payload)
    {
        auto batch = decodeEvent<SharedData::ConflictBatch>(SharedData::Events::askForOverwrite, payload);
        if (!batch)
            return reject(std::move(batch).error());

        if (state_ == CoordinatorState::AwaitingConflictDecision)
            return reject(ClientError{
                .type = ClientErrorType::ProtocolViolation,
                .extraInfo = "Worker sent a second conflict batch while one is still open",
            });

        if (state_ != CoordinatorState::Busy)
            return reject(ClientError{
                .type = ClientErrorType::ProtocolViolation,
                .extraInfo = fmt::format("Worker sent a conflict batch while {}", toString(state_)),
            });

        auto session = ConflictResolutionSession::create(std::move(*batch), session_->request.destinationPath);
        if (!session)
            return reject(std::move(session).error());

        conflictSession_.emplace(std::move(*session));
        Log::info(
            "Conflict session {} opened with {} conflicting and {} free path(s).",
            conflictSession_->id().shortValue(),
            conflictSession_->conflictCount(),
            conflictSession_->batch().nonConflictingPaths.size());

        enterState(CoordinatorState::AwaitingConflictDecision);

        if (conflictSession_->finalized())
            return sendResolution();

        promptCurrentConflict();
        return {};
    }

    std::expected<void, ClientError> OperationCoordinator::decide(ConflictDecision decision)
    {
        if (state_ != CoordinatorState::AwaitingConflictDecision || !conflictSession_)
            return reject(
                ClientError{.type = ClientErrorType::NoConflictSession, .extraInfo = "There is no open conflict"},
                Severity::Warning);

        // every conflict is decided but the resolution did not reach the worker
        if (conflictSession_->finalized())
        {
            Log::info("Conflict session {}: sending the decisions again.", conflictSession_->id().shortValue());
            return sendResolution();
        }

        if (auto decided = conflictSession_->decide(decision); !decided)
            return reject(std::move(decided).error(), Severity::Warning);

        Log::debug(
            "Conflict session {}: {} ({}/{}).",
            conflictSession_->id().shortValue(),
            toString(decision),
            conflictSession_->cursor(),
            conflictSession_->conflictCount());

        if (conflictSession_->finalized())
            return sendResolution();

        promptCurrentConflict();
        return {};
    }

    std::expected<void, ClientError> OperationCoordinator::sendResolution()
    {
        const auto resolution = conflictSession_->resolution();

        if (!conflictSession_->skip().empty())
            Log::info(
                "Conflict session {} skips: {}",
                conflictSession_->id().shortValue(),
                fmt::join(conflictSession_->skip(), ", "));

        if (auto emitted = channel_->emit(SharedData::Events::resolveConflicts, nlohmann::json(resolution)); !emitted)
            return reject(ClientError{
                .type = ClientErrorType::ChannelFailure,
                .extraInfo = fmt::format(
                    "Could not send the conflict decisions, answer again to retry: {}", emitted.error().toString()),
            });

        Log::info(
            "Conflict session {} resolved: {} overwrite, {} skip.",
            conflictSession_->id().shortValue(),
            conflictSession_->overwrite().size(),
            conflictSession_->skip().size());

        discardConflictSession();
        enterState(CoordinatorState::Busy);
        return {};
    }

    void OperationCoordinator::promptCurrentConflict()
    {
        if (const auto path = conflictSession_->currentPath(); path)
            surface_->promptConflict(*path, conflictSession_->cursor(), conflictSession_->conflictCount());
    }

    void OperationCoordinator::discardConflictSession()
    {
        if (!conflictSession_)
            return;
        conflictSession_.reset();
        surface_->closeConflictPrompt();
    }

    std::expected<void, ClientError> OperationCoordinator::cancel()
    {
        if (state_ == CoordinatorState::Idle)
            return reject(
                ClientError{.type = ClientErrorType::NotBusy, .extraInfo = "No operation is running"},
                Severity::Warning);

        if (state_ == CoordinatorState::Cancelling)
            return reject(
                ClientError{.type = ClientErrorType::AlreadyCancelling, .extraInfo = "Cancellation already requested"},
                Severity::Info);

        if (auto emitted = channel_->emit(SharedData::Events::cancelOperation, nlohmann::json::object()); !emitted)
            return reject(ClientError{
                .type = ClientErrorType::ChannelFailure,
                .extraInfo = fmt::format("Could not send the cancel request: {}", emitted.error().toString()),
            });

        Log::info("Cancel requested for operation {}.", session_ ? session_->id.shortValue() : std::string{"?"});
        discardConflictSession();
        enterState(CoordinatorState::Cancelling);
        surface_->notify(Severity::Info, "Cancelling...");
        return {};
    }

    std::expected<Ids::OperationId, ClientError> OperationCoordinator::transferUniques()
    {
        if (!duplicateScan_)
            return startFollowUp(std::unexpected(
                ClientError{.type = ClientErrorType::NoScanResult, .extraInfo = "Run a duplicate scan first"}));

        auto uniques = duplicateScan_->uniques();
        if (uniques.empty())
            return startFollowUp(std::unexpected(
                ClientError{.type = ClientErrorType::NothingSelected, .extraInfo = "The scan found no unique files"}));
        return startFollowUp(std::move(uniques));
    }

    std::expected<Ids::OperationId, ClientError> OperationCoordinator::transferAll()
    {
        if (!duplicateScan_)
            return startFollowUp(std::unexpected(
                ClientError{.type = ClientErrorType::NoScanResult, .extraInfo = "Run a duplicate scan first"}));
        return startFollowUp(duplicateScan_->all());
    }

    std::expected<Ids::OperationId, ClientError> OperationCoordinator::transferManualSelection()
    {
        if (!duplicateScan_)
            return startFollowUp(std::unexpected(
                ClientError{.type = ClientErrorType::NoScanResult, .extraInfo = "Run a duplicate scan first"}));
        return startFollowUp(duplicateScan_->manualSelection());
    }

    std::expected<Ids::OperationId, ClientError>
    OperationCoordinator::startFollowUp(std::expected<std::vector<std::string>, ClientError> paths)
    {
        if (!paths)
            return reject<Ids::OperationId>(std::move(paths).error(), Severity::Warning);

        auto started = start(makeRequest(SharedData::OperationKind::Copy, std::move(*paths)));
        if (started)
        {
            Log::debug("Duplicate scan result consumed by operation {}.", started->shortValue());
            duplicateScan_.reset();
        }
        return started;
    }

    std::expected<void, ClientError> OperationCoordinator::destinationPath(std::string path)
    {
        if (state_ != CoordinatorState::Idle)
            return reject(
                ClientError{
                    .type = ClientErrorType::NotIdle,
                    .extraInfo = "The destination cannot change while an operation runs",
                },
                Severity::Warning);

        if (path.empty())
            return reject(
                ClientError{.type = ClientErrorType::InvalidRequest, .extraInfo = "The destination must not be empty"},
                Severity::Warning);

        Log::info("Destination set to '{}'.", path);
        destinationPath_ = std::move(path);
        return {};
    }

    std::string const& OperationCoordinator::destinationPath() const
    {
        return destinationPath_;
    }

    void OperationCoordinator::authenticatedUser(std::optional<std::string> user)
    {
        authenticatedUser_ = std::move(user);
        updateControls();
    }

    std::optional<std::string> const& OperationCoordinator::authenticatedUser() const
    {
        return authenticatedUser_;
    }

    CoordinatorState OperationCoordinator::state() const
    {
        return state_;
    }

    bool OperationCoordinator::isIdle() const
    {
        return state_ == CoordinatorState::Idle;
    }

    std::optional<OperationSession> const& OperationCoordinator::session() const
    {
        return session_;
    }

    std::optional<ConflictResolutionSession> const& OperationCoordinator::conflictSession() const
    {
        return conflictSession_;
    }

    std::optional<SharedData::OperationSummary> const& OperationCoordinator::lastSummary() const
    {
        return lastSummary_;
    }

    DuplicateScanSession* OperationCoordinator::duplicateScan()
    {
        return duplicateScan_ ? &*duplicateScan_ : nullptr;
    }

    DuplicateScanSession const* OperationCoordinator::duplicateScan() const
    {
        return duplicateScan_ ? &*duplicateScan_ : nullptr;
    }

    void OperationCoordinator::enterState(CoordinatorState state)
    {
        if (state_ == state)
            return;

        Log::debug("Coordinator: {} -> {}", toString(state_), toString(state));
        state_ = state;
        updateControls();
    }

    void OperationCoordinator::enterIdle()
    {
        if (session_)
        {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - session_->startTime);
            Log::debug("Operation {} ended after {} ms.", session_->id.shortValue(), elapsed.count());
        }
        session_.reset();
        enterState(CoordinatorState::Idle);
    }

    void OperationCoordinator::updateControls()
    {
        const bool idle = state_ == CoordinatorState::Idle;
        surface_->operationControlsEnabled(idle);
        surface_->cancelEnabled(!idle);
        surface_->cloudControlsEnabled(idle && authenticatedUser_.has_value());
    }
}
