#pragma once

#include <client/control_surface.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

/**
 * @brief ControlSurface that writes to a text stream. Remembers the gating so that the command interpreter can
 * refuse commands the way a GUI would grey out its buttons.
 */
class ConsoleControlSurface : public Client::ControlSurface
{
  public:
    explicit ConsoleControlSurface(std::ostream& out);

    void operationControlsEnabled(bool enabled) override;
    void cancelEnabled(bool enabled) override;
    void cloudControlsEnabled(bool enabled) override;
    void notify(Client::Severity severity, std::string const& message) override;
    void showProgress(std::uint64_t current, std::uint64_t total) override;
    void promptConflict(std::string const& path, std::size_t index, std::size_t count) override;
    void closeConflictPrompt() override;
    void showDuplicateScanResult(Client::DuplicateScanSession const& session) override;
    void appendWorkerLog(std::string const& type, std::string const& message) override;
    void requestListingRefresh() override;

    bool operationControlsEnabled() const;
    bool cancelEnabled() const;
    bool cloudControlsEnabled() const;
    bool conflictPromptOpen() const;

    void onListingRefreshRequested(std::function<void()> handler);

  private:
    std::ostream* out_;
    bool operationControls_;
    bool cancel_;
    bool cloud_;
    bool conflictPromptOpen_;
    std::optional<unsigned> lastPercent_;
    std::function<void()> onListingRefresh_;
};
