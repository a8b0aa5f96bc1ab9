#pragma once

#include <client/client_error.hpp>
#include <shared_data/file_operations/conflict_batch.hpp>
#include <shared_data/file_operations/conflict_resolution.hpp>
#include <ids/ids.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Client
{
    enum class ConflictDecision
    {
        Overwrite,
        Skip,
        OverwriteAll,
        SkipAll
    };

    std::string toString(ConflictDecision decision);

    /**
     * @brief Walks the operator through one batch of conflicting paths.
     *
     * A cursor runs over the conflicting paths in batch order. Every decision moves the path under the cursor
     * (or, for the "all" decisions, every remaining path) into either the overwrite or the skip buffer. Once the
     * cursor reached the end the session is finalized and yields a single ConflictResolution.
     */
    class ConflictResolutionSession
    {
      public:
        /**
         * @brief Validates the batch and opens a session on it. A batch listing a path twice is rejected.
         *
         * @param batch As pushed by the worker.
         * @param destinationPath Local destination folder of the running operation.
         */
        static std::expected<ConflictResolutionSession, ClientError>
        create(SharedData::ConflictBatch batch, std::string destinationPath);

        Ids::ConflictSessionId id() const;

        std::expected<void, ClientError> decide(ConflictDecision decision);

        bool finalized() const;
        std::size_t cursor() const;
        std::size_t conflictCount() const;

        /**
         * @brief The path awaiting a decision, nullopt once finalized.
         */
        std::optional<std::string> currentPath() const;

        std::vector<std::string> const& overwrite() const;
        std::vector<std::string> const& skip() const;
        SharedData::ConflictBatch const& batch() const;

        /**
         * @brief The merged decision. Paths not yet decided are absent, i.e. skipped.
         */
        SharedData::ConflictResolution resolution() const;

      private:
        ConflictResolutionSession(SharedData::ConflictBatch batch, std::string destinationPath);

      private:
        Ids::ConflictSessionId id_;
        SharedData::ConflictBatch batch_;
        std::string destinationPath_;
        std::size_t cursor_;
        std::vector<std::string> overwrite_;
        std::vector<std::string> skip_;
        bool finalized_;
    };
}
