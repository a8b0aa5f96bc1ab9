#pragma once

#include <client/client_error.hpp>
#include <client/conflict_resolution_session.hpp>
#include <client/control_surface.hpp>
#include <client/duplicate_scan_session.hpp>
#include <client/operation_session.hpp>
#include <shared_data/file_operations/operation_request.hpp>
#include <shared_data/file_operations/operation_summary.hpp>
#include <worker/event_channel.hpp>

#include <nlohmann/json.hpp>

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace Client
{
    enum class CoordinatorState
    {
        Idle,
        Busy,
        AwaitingConflictDecision,
        Cancelling
    };

    std::string toString(CoordinatorState state);

    /**
     * @brief Owns the lifecycle of the one bulk operation that may run at a time.
     *
     * Starts operations over the event channel, interprets what the worker pushes back and keeps the control
     * surface gated accordingly. Operation controls are enabled exactly while idle, cancel exactly while not.
     * All members must be called from the io thread.
     */
    class OperationCoordinator
    {
      public:
        OperationCoordinator(Worker::EventChannel& channel, ControlSurface& surface);

        OperationCoordinator(OperationCoordinator const&) = delete;
        OperationCoordinator& operator=(OperationCoordinator const&) = delete;
        OperationCoordinator(OperationCoordinator&&) = delete;
        OperationCoordinator& operator=(OperationCoordinator&&) = delete;
        ~OperationCoordinator() = default;

        /**
         * @brief Validates and submits an operation. The state only changes if the channel accepted it.
         */
        std::expected<Ids::OperationId, ClientError> start(SharedData::OperationRequest request);

        /**
         * @brief Builds a request for the current destination and user.
         */
        SharedData::OperationRequest makeRequest(SharedData::OperationKind kind, std::vector<std::string> paths) const;

        /**
         * @brief Feeds one event pushed by the worker. Events that do not fit the current state are logged
         * and ignored, malformed ones are rejected as protocol violations.
         */
        std::expected<void, ClientError> onChannelEvent(std::string const& event, nlohmann::json const& payload);

        /**
         * @brief Channel connectivity. A lost connection is reported, the state is kept.
         */
        void onConnectionChange(bool connected);

        /**
         * @brief Asks the worker to stop. The coordinator stays in Cancelling until the worker acknowledges.
         */
        std::expected<void, ClientError> cancel();

        /**
         * @brief Applies the operator's decision to the open conflict session. Sends the resolution once every
         * conflict is decided.
         */
        std::expected<void, ClientError> decide(ConflictDecision decision);

        std::expected<Ids::OperationId, ClientError> transferUniques();
        std::expected<Ids::OperationId, ClientError> transferAll();
        std::expected<Ids::OperationId, ClientError> transferManualSelection();

        std::expected<void, ClientError> destinationPath(std::string path);
        std::string const& destinationPath() const;

        void authenticatedUser(std::optional<std::string> user);
        std::optional<std::string> const& authenticatedUser() const;

        CoordinatorState state() const;
        bool isIdle() const;

        std::optional<OperationSession> const& session() const;
        std::optional<ConflictResolutionSession> const& conflictSession() const;
        std::optional<SharedData::OperationSummary> const& lastSummary() const;

        DuplicateScanSession* duplicateScan();
        DuplicateScanSession const* duplicateScan() const;

      private:
        std::expected<void, ClientError> onProgress(nlohmann::json const& payload);
        std::expected<void, ClientError> onLogMessage(nlohmann::json const& payload);
        std::expected<void, ClientError> onOperationComplete(nlohmann::json const& payload);
        std::expected<void, ClientError> onOperationCancelled();
        std::expected<void, ClientError> onScanComplete(nlohmann::json const& payload);
        std::expected<void, ClientError> onAskForOverwrite(nlohmann::json const& payload);

        std::expected<Ids::OperationId, ClientError> startFollowUp(
            std::expected<std::vector<std::string>, ClientError> paths);
        std::expected<void, ClientError> sendResolution();
        void promptCurrentConflict();
        void discardConflictSession();
        void enterState(CoordinatorState state);
        void enterIdle();
        void updateControls();

        template <typename T = void>
        std::expected<T, ClientError> reject(ClientError error, Severity severity = Severity::Error);

      private:
        Worker::EventChannel* channel_;
        ControlSurface* surface_;
        CoordinatorState state_;
        std::optional<OperationSession> session_;
        std::optional<ConflictResolutionSession> conflictSession_;
        std::optional<DuplicateScanSession> duplicateScan_;
        std::optional<SharedData::OperationSummary> lastSummary_;
        std::string destinationPath_;
        std::optional<std::string> authenticatedUser_;
    };
}
