#pragma once

#include <client/account_session.hpp>
#include <client/control_surface.hpp>
#include <client/operation_coordinator.hpp>
#include <client/preview_service.hpp>
#include <client/remote_browser.hpp>

#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

/**
 * @brief Turns console lines into calls on the client core.
 *
 * Remote names are resolved against the directory the browser is in. Absolute remote paths are taken as is.
 */
class CommandInterpreter
{
  public:
    enum class Outcome
    {
        Continue,
        Quit
    };

    CommandInterpreter(
        Client::OperationCoordinator& coordinator,
        Client::RemoteBrowser& browser,
        Client::AccountSession& accounts,
        Client::PreviewService& preview,
        Client::ControlSurface& surface,
        std::ostream& out);

    Outcome execute(std::string_view line);

    /**
     * @brief Reloads the remote listing and prints it.
     */
    void refreshListing();

    void printHelp() const;

    /**
     * @brief Splits at whitespace. Double quotes group words, a backslash escapes the next character.
     */
    static std::vector<std::string> tokenize(std::string_view line);

  private:
    using Arguments = std::vector<std::string>;
    using Handler = std::function<void(CommandInterpreter&, Arguments const&)>;

    void listing(Arguments const& args);
    void changeDirectory(Arguments const& args);
    void up(Arguments const& args);
    void printWorkingDirectory(Arguments const& args);
    void destination(Arguments const& args);
    void startTransfer(SharedData::OperationKind kind, Arguments const& args);
    void scan(Arguments const& args);
    void restore(Arguments const& args);
    void decide(Client::ConflictDecision decision);
    void cancel(Arguments const& args);
    void duplicates(Arguments const& args);
    void select(Arguments const& args, bool selected);
    void transfer(Arguments const& args);
    void preview(Arguments const& args);
    void previewSelected(Arguments const& args);
    void login(Arguments const& args);
    void logout(Arguments const& args);
    void createAccount(Arguments const& args);
    void users(Arguments const& args);
    void deleteUser(Arguments const& args);
    void state(Arguments const& args);

    std::string remotePath(std::string const& name) const;
    void printListing() const;
    void usage(std::string_view text) const;
    void report(Client::ClientError const& error) const;

  private:
    Client::OperationCoordinator* coordinator_;
    Client::RemoteBrowser* browser_;
    Client::AccountSession* accounts_;
    Client::PreviewService* preview_;
    Client::ControlSurface* surface_;
    std::ostream* out_;
    std::unordered_map<std::string, Handler> commands_;
};
