#include <client/conflict_resolution_session.hpp>

#include <fmt/format.h>

#include <unordered_set>

namespace Client
{
    std::string toString(ConflictDecision decision)
    {
        switch (decision)
        {
            case ConflictDecision::Overwrite:
                return "overwrite";
            case ConflictDecision::Skip:
                return "skip";
            case ConflictDecision::OverwriteAll:
                return "overwrite all";
            case ConflictDecision::SkipAll:
                return "skip all";
        }
        return "INVALID_ENUM_VALUE";
    }

    ConflictResolutionSession::ConflictResolutionSession(SharedData::ConflictBatch batch, std::string destinationPath)
        : id_{Ids::generateConflictSessionId()}
        , batch_{std::move(batch)}
        , destinationPath_{std::move(destinationPath)}
        , cursor_{0}
        , overwrite_{}
        , skip_{}
        , finalized_{batch_.conflictingPaths.empty()}
    {
        overwrite_.reserve(batch_.conflictingPaths.size());
    }

    std::expected<ConflictResolutionSession, ClientError>
    ConflictResolutionSession::create(SharedData::ConflictBatch batch, std::string destinationPath)
    {
        std::unordered_set<std::string_view> conflicting{};
        for (auto const& path : batch.conflictingPaths)
        {
            if (!conflicting.insert(path).second)
                return std::unexpected(ClientError{
                    .type = ClientErrorType::ProtocolViolation,
                    .extraInfo = fmt::format("Conflict batch lists '{}' more than once", path),
                });
        }
        for (auto const& path : batch.nonConflictingPaths)
        {
            if (conflicting.contains(path))
                return std::unexpected(ClientError{
                    .type = ClientErrorType::ProtocolViolation,
                    .extraInfo = fmt::format("Conflict batch lists '{}' as conflicting and non-conflicting", path),
                });
        }

        return ConflictResolutionSession{std::move(batch), std::move(destinationPath)};
    }

    Ids::ConflictSessionId ConflictResolutionSession::id() const
    {
        return id_;
    }

    std::expected<void, ClientError> ConflictResolutionSession::decide(ConflictDecision decision)
    {
        if (finalized_)
            return std::unexpected(ClientError{
                .type = ClientErrorType::SessionFinalized,
                .extraInfo = "Every conflict of this batch has already been decided",
            });

        auto const& paths = batch_.conflictingPaths;
        switch (decision)
        {
            case ConflictDecision::Overwrite:
                overwrite_.push_back(paths[cursor_++]);
                break;
            case ConflictDecision::Skip:
                skip_.push_back(paths[cursor_++]);
                break;
            case ConflictDecision::OverwriteAll:
                overwrite_.insert(overwrite_.end(), paths.begin() + cursor_, paths.end());
                cursor_ = paths.size();
                break;
            case ConflictDecision::SkipAll:
                skip_.insert(skip_.end(), paths.begin() + cursor_, paths.end());
                cursor_ = paths.size();
                break;
        }

        finalized_ = cursor_ == paths.size();
        return {};
    }

    bool ConflictResolutionSession::finalized() const
    {
        return finalized_;
    }

    std::size_t ConflictResolutionSession::cursor() const
    {
        return cursor_;
    }

    std::size_t ConflictResolutionSession::conflictCount() const
    {
        return batch_.conflictingPaths.size();
    }

    std::optional<std::string> ConflictResolutionSession::currentPath() const
    {
        if (finalized_)
            return std::nullopt;
        return batch_.conflictingPaths[cursor_];
    }

    std::vector<std::string> const& ConflictResolutionSession::overwrite() const
    {
        return overwrite_;
    }

    std::vector<std::string> const& ConflictResolutionSession::skip() const
    {
        return skip_;
    }

    SharedData::ConflictBatch const& ConflictResolutionSession::batch() const
    {
        return batch_;
    }

    SharedData::ConflictResolution ConflictResolutionSession::resolution() const
    {
        return SharedData::ConflictResolution{
            .pathsToOverwrite = overwrite_,
            .pathsToProcessFirst = batch_.nonConflictingPaths,
            .isMoveOperation = batch_.isMoveOperation,
            .destinationPath = destinationPath_,
        };
    }
}
