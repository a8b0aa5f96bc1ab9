#pragma once

#include <client/client_error.hpp>
#include <shared_data/file_operations/duplicate_scan_result.hpp>

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace Client
{
    /**
     * @brief Result of a duplicate scan plus the operator's selection of group members to transfer.
     * By default the first file of every group (the keeper) stays behind and all others are selected.
     */
    class DuplicateScanSession
    {
      public:
        explicit DuplicateScanSession(SharedData::DuplicateScanResult result);

        SharedData::DuplicateScanResult const& result() const;

        std::size_t groupCount() const;
        std::size_t duplicateFileCount() const;

        bool isSelected(std::size_t groupIndex, std::size_t fileIndex) const;
        std::expected<void, ClientError> select(std::size_t groupIndex, std::size_t fileIndex, bool selected);
        std::size_t selectedCount() const;

        /**
         * @brief Files that have no duplicate.
         */
        std::vector<std::string> uniques() const;

        /**
         * @brief Everything the scan saw. Falls back to the uniques followed by every group member when the worker
         * did not report the union itself.
         */
        std::vector<std::string> all() const;

        /**
         * @brief The selected group members in group order.
         */
        std::expected<std::vector<std::string>, ClientError> manualSelection() const;

        /**
         * @brief The one selected group member, for previewing it.
         */
        std::expected<std::string, ClientError> previewCandidate() const;

      private:
        SharedData::DuplicateScanResult result_;
        std::vector<std::vector<bool>> selection_;
    };
}
