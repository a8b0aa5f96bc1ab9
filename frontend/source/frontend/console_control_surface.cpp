#include <frontend/console_control_surface.hpp>
#include <client/duplicate_scan_session.hpp>

#include <fmt/format.h>

namespace
{
    std::string_view severityTag(Client::Severity severity)
    {
        switch (severity)
        {
            case Client::Severity::Info:
                return "*";
            case Client::Severity::Success:
                return "+";
            case Client::Severity::Warning:
                return "!";
            case Client::Severity::Error:
                return "x";
        }
        return "*";
    }
}

ConsoleControlSurface::ConsoleControlSurface(std::ostream& out)
    : out_{&out}
    , operationControls_{true}
    , cancel_{false}
    , cloud_{false}
    , conflictPromptOpen_{false}
    , lastPercent_{}
    , onListingRefresh_{}
{}

void ConsoleControlSurface::operationControlsEnabled(bool enabled)
{
    operationControls_ = enabled;
}

void ConsoleControlSurface::cancelEnabled(bool enabled)
{
    cancel_ = enabled;
}

void ConsoleControlSurface::cloudControlsEnabled(bool enabled)
{
    cloud_ = enabled;
}

void ConsoleControlSurface::notify(Client::Severity severity, std::string const& message)
{
    *out_ << fmt::format("[{}] {}\n", severityTag(severity), message) << std::flush;
}

void ConsoleControlSurface::showProgress(std::uint64_t current, std::uint64_t total)
{
    if (total == 0)
    {
        lastPercent_.reset();
        return;
    }

    const auto percent = static_cast<unsigned>(current * 100 / total);
    if (lastPercent_ == percent)
        return;
    lastPercent_ = percent;
    *out_ << fmt::format("Progress: {}/{} ({}%)\n", current, total, percent) << std::flush;
}

void ConsoleControlSurface::promptConflict(std::string const& path, std::size_t index, std::size_t count)
{
    conflictPromptOpen_ = true;
    *out_ << fmt::format(
                 "Conflict {}/{}: '{}' already exists at the destination.\n"
                 "  overwrite | skip | overwrite-all | skip-all\n",
                 index + 1,
                 count,
                 path)
          << std::flush;
}

void ConsoleControlSurface::closeConflictPrompt()
{
    conflictPromptOpen_ = false;
}

void ConsoleControlSurface::showDuplicateScanResult(Client::DuplicateScanSession const& session)
{
    auto const& result = session.result();

    std::string text = fmt::format("Unique files: {}\n", result.uniqueFiles.size());
    for (auto const& file : result.uniqueFiles)
        text += fmt::format("    {}\n", file);

    text += fmt::format("Duplicate groups: {}\n", session.groupCount());
    for (std::size_t group = 0; group != result.duplicateGroups.size(); ++group)
    {
        auto const& duplicates = result.duplicateGroups[group];
        text += fmt::format("  Group {}{}\n", group + 1, duplicates.hash ? " (" + *duplicates.hash + ")" : "");
        for (std::size_t file = 0; file != duplicates.files.size(); ++file)
        {
            text += fmt::format(
                "    [{}] {}.{} {}\n",
                session.isSelected(group, file) ? 'x' : ' ',
                group + 1,
                file + 1,
                duplicates.files[file]);
        }
    }
    text += fmt::format(
        "{} of {} duplicates selected for transfer.\n", session.selectedCount(), session.duplicateFileCount());

    *out_ << text << std::flush;
}

void ConsoleControlSurface::appendWorkerLog(std::string const& type, std::string const& message)
{
    *out_ << fmt::format("worker {}: {}\n", type, message) << std::flush;
}

void ConsoleControlSurface::requestListingRefresh()
{
    if (onListingRefresh_)
        onListingRefresh_();
}

bool ConsoleControlSurface::operationControlsEnabled() const
{
    return operationControls_;
}

bool ConsoleControlSurface::cancelEnabled() const
{
    return cancel_;
}

bool ConsoleControlSurface::cloudControlsEnabled() const
{
    return cloud_;
}

bool ConsoleControlSurface::conflictPromptOpen() const
{
    return conflictPromptOpen_;
}

void ConsoleControlSurface::onListingRefreshRequested(std::function<void()> handler)
{
    onListingRefresh_ = std::move(handler);
}
