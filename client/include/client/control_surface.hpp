#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace Client
{
    class DuplicateScanSession;

    enum class Severity
    {
        Info,
        Success,
        Warning,
        Error
    };

    inline std::string toString(Severity severity)
    {
        switch (severity)
        {
            case Severity::Info:
                return "info";
            case Severity::Success:
                return "success";
            case Severity::Warning:
                return "warning";
            case Severity::Error:
                return "error";
        }
        return "info";
    }

    /**
     * @brief Everything the client core needs from a user interface.
     * All calls are made on the io thread.
     */
    class ControlSurface
    {
      public:
        ControlSurface() = default;
        virtual ~ControlSurface() = default;
        ControlSurface(ControlSurface const&) = delete;
        ControlSurface& operator=(ControlSurface const&) = delete;
        ControlSurface(ControlSurface&&) = delete;
        ControlSurface& operator=(ControlSurface&&) = delete;

        // Copy, move, scan and destination selection.
        virtual void operationControlsEnabled(bool enabled) = 0;
        virtual void cancelEnabled(bool enabled) = 0;
        // Cloud backup and restore.
        virtual void cloudControlsEnabled(bool enabled) = 0;

        /**
         * @brief A short message for the operator, like a toast.
         */
        virtual void notify(Severity severity, std::string const& message) = 0;

        virtual void showProgress(std::uint64_t current, std::uint64_t total) = 0;

        /**
         * @brief Asks the operator how to handle one existing destination file.
         *
         * @param path The conflicting remote path.
         * @param index Zero based position of the path in the batch.
         * @param count Number of conflicting paths in the batch.
         */
        virtual void promptConflict(std::string const& path, std::size_t index, std::size_t count) = 0;
        virtual void closeConflictPrompt() = 0;

        virtual void showDuplicateScanResult(DuplicateScanSession const& session) = 0;
        virtual void appendWorkerLog(std::string const& type, std::string const& message) = 0;

        /**
         * @brief The remote directory contents changed, the listing should be reloaded.
         */
        virtual void requestListingRefresh() = 0;
    };
}
