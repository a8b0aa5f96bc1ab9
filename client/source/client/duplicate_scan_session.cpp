#include <client/duplicate_scan_session.hpp>

#include <fmt/format.h>

#include <unordered_set>

namespace Client
{
    DuplicateScanSession::DuplicateScanSession(SharedData::DuplicateScanResult result)
        : result_{std::move(result)}
        , selection_{}
    {
        selection_.reserve(result_.duplicateGroups.size());
        for (auto const& group : result_.duplicateGroups)
        {
            std::vector<bool> flags(group.files.size(), true);
            if (!flags.empty())
                flags.front() = false;
            selection_.push_back(std::move(flags));
        }
    }

    SharedData::DuplicateScanResult const& DuplicateScanSession::result() const
    {
        return result_;
    }

    std::size_t DuplicateScanSession::groupCount() const
    {
        return result_.duplicateGroups.size();
    }

    std::size_t DuplicateScanSession::duplicateFileCount() const
    {
        std::size_t count = 0;
        for (auto const& group : result_.duplicateGroups)
            count += group.files.size();
        return count;
    }

    bool DuplicateScanSession::isSelected(std::size_t groupIndex, std::size_t fileIndex) const
    {
        if (groupIndex >= selection_.size() || fileIndex >= selection_[groupIndex].size())
            return false;
        return selection_[groupIndex][fileIndex];
    }

    std::expected<void, ClientError>
    DuplicateScanSession::select(std::size_t groupIndex, std::size_t fileIndex, bool selected)
    {
        if (groupIndex >= selection_.size() || fileIndex >= selection_[groupIndex].size())
            return std::unexpected(ClientError{
                .type = ClientErrorType::InvalidSelection,
                .extraInfo = fmt::format("There is no file {} in duplicate group {}", fileIndex + 1, groupIndex + 1),
            });

        selection_[groupIndex][fileIndex] = selected;
        return {};
    }

    std::size_t DuplicateScanSession::selectedCount() const
    {
        std::size_t count = 0;
        for (auto const& flags : selection_)
        {
            for (bool flag : flags)
                count += flag ? 1 : 0;
        }
        return count;
    }

    std::vector<std::string> DuplicateScanSession::uniques() const
    {
        return result_.uniqueFiles;
    }

    std::vector<std::string> DuplicateScanSession::all() const
    {
        if (!result_.allFiles.empty())
            return result_.allFiles;

        std::vector<std::string> files{};
        std::unordered_set<std::string> seen{};
        auto add = [&](std::string const& file) {
            if (seen.insert(file).second)
                files.push_back(file);
        };

        for (auto const& file : result_.uniqueFiles)
            add(file);
        for (auto const& group : result_.duplicateGroups)
        {
            for (auto const& file : group.files)
                add(file);
        }
        return files;
    }

    std::expected<std::vector<std::string>, ClientError> DuplicateScanSession::manualSelection() const
    {
        if (result_.duplicateGroups.empty())
            return std::unexpected(ClientError{
                .type = ClientErrorType::NoDuplicateGroups,
                .extraInfo = "The scan found no duplicates to choose from",
            });

        std::vector<std::string> files{};
        for (std::size_t group = 0; group != selection_.size(); ++group)
        {
            for (std::size_t file = 0; file != selection_[group].size(); ++file)
            {
                if (selection_[group][file])
                    files.push_back(result_.duplicateGroups[group].files[file]);
            }
        }

        if (files.empty())
            return std::unexpected(ClientError{
                .type = ClientErrorType::NothingSelected,
                .extraInfo = "No files selected for transfer",
            });
        return files;
    }

    std::expected<std::string, ClientError> DuplicateScanSession::previewCandidate() const
    {
        auto selected = manualSelection();
        if (!selected)
            return std::unexpected(std::move(selected).error());

        if (selected->size() != 1)
            return std::unexpected(ClientError{
                .type = ClientErrorType::InvalidSelection,
                .extraInfo = "Select exactly one file to preview",
            });
        return selected->front();
    }
}
