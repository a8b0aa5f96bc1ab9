#include <frontend/command_interpreter.hpp>
#include <persistence/paths.hpp>
#include <utility/algorithm/case_convert.hpp>
#include <utility/algorithm/trim.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <optional>

namespace
{
    std::optional<std::size_t> parseIndex(std::string const& text)
    {
        std::size_t value = 0;
        const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || end != text.data() + text.size() || value == 0)
            return std::nullopt;
        return value - 1;
    }

    std::string joinRest(std::vector<std::string> const& args, std::size_t from)
    {
        std::string result;
        for (std::size_t i = from; i < args.size(); ++i)
        {
            if (!result.empty())
                result.push_back(' ');
            result += args[i];
        }
        return result;
    }
}

CommandInterpreter::CommandInterpreter(
    Client::OperationCoordinator& coordinator,
    Client::RemoteBrowser& browser,
    Client::AccountSession& accounts,
    Client::PreviewService& preview,
    Client::ControlSurface& surface,
    std::ostream& out)
    : coordinator_{&coordinator}
    , browser_{&browser}
    , accounts_{&accounts}
    , preview_{&preview}
    , surface_{&surface}
    , out_{&out}
    , commands_{}
{
    using enum SharedData::OperationKind;
    using Self = CommandInterpreter;

    commands_ = {
        {"ls", &Self::listing},
        {"refresh", &Self::listing},
        {"cd", &Self::changeDirectory},
        {"up", &Self::up},
        {"pwd", &Self::printWorkingDirectory},
        {"dest", &Self::destination},
        {"copy",
         [](Self& self, Arguments const& args) {
             self.startTransfer(Copy, args);
         }},
        {"move",
         [](Self& self, Arguments const& args) {
             self.startTransfer(Move, args);
         }},
        {"backup",
         [](Self& self, Arguments const& args) {
             self.startTransfer(CloudBackup, args);
         }},
        {"scan", &Self::scan},
        {"restore", &Self::restore},
        {"overwrite",
         [](Self& self, Arguments const&) {
             self.decide(Client::ConflictDecision::Overwrite);
         }},
        {"skip",
         [](Self& self, Arguments const&) {
             self.decide(Client::ConflictDecision::Skip);
         }},
        {"overwrite-all",
         [](Self& self, Arguments const&) {
             self.decide(Client::ConflictDecision::OverwriteAll);
         }},
        {"skip-all",
         [](Self& self, Arguments const&) {
             self.decide(Client::ConflictDecision::SkipAll);
         }},
        {"cancel", &Self::cancel},
        {"dupes", &Self::duplicates},
        {"select",
         [](Self& self, Arguments const& args) {
             self.select(args, true);
         }},
        {"deselect",
         [](Self& self, Arguments const& args) {
             self.select(args, false);
         }},
        {"transfer", &Self::transfer},
        {"preview", &Self::preview},
        {"preview-selected", &Self::previewSelected},
        {"login", &Self::login},
        {"logout", &Self::logout},
        {"create-account", &Self::createAccount},
        {"users", &Self::users},
        {"delete-user", &Self::deleteUser},
        {"state", &Self::state},
        {"help",
         [](Self& self, Arguments const&) {
             self.printHelp();
         }},
    };
}

CommandInterpreter::Outcome CommandInterpreter::execute(std::string_view line)
{
    const auto trimmed = Utility::Algorithm::trim(line);
    if (trimmed.empty())
        return Outcome::Continue;

    auto tokens = tokenize(trimmed);
    if (tokens.empty())
        return Outcome::Continue;

    const auto command = Utility::Algorithm::toLowerCase(tokens.front());
    tokens.erase(tokens.begin());

    if (command == "quit" || command == "exit")
        return Outcome::Quit;

    const auto handler = commands_.find(command);
    if (handler == commands_.end())
    {
        *out_ << fmt::format("Unknown command '{}'. Type 'help' for a list of commands.\n", command);
        return Outcome::Continue;
    }

    Log::debug("Command '{}' with {} argument(s).", command, tokens.size());
    handler->second(*this, tokens);
    return Outcome::Continue;
}

std::vector<std::string> CommandInterpreter::tokenize(std::string_view line)
{
    std::vector<std::string> tokens{};
    std::string current{};
    bool inToken = false;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i)
    {
        const char c = line[i];
        if (c == '\\' && i + 1 < line.size())
        {
            current.push_back(line[++i]);
            inToken = true;
        }
        else if (c == '"')
        {
            quoted = !quoted;
            inToken = true;
        }
        else if (!quoted && (c == ' ' || c == '\t'))
        {
            if (inToken)
                tokens.push_back(std::move(current));
            current.clear();
            inToken = false;
        }
        else
        {
            current.push_back(c);
            inToken = true;
        }
    }
    if (inToken)
        tokens.push_back(std::move(current));
    return tokens;
}

void CommandInterpreter::refreshListing()
{
    browser_->refresh([this](std::expected<void, Client::ClientError> result) {
        if (!result)
            return report(result.error());
        printListing();
    });
}

void CommandInterpreter::printHelp() const
{
    *out_ << "Browsing:\n"
             "  ls | refresh               reload the current remote directory\n"
             "  cd <dir> | cd .. | up      change the remote directory\n"
             "  pwd                        show the remote directory\n"
             "  dest [path]                show or set the local destination folder\n"
             "  preview <file>             open a remote file locally\n"
             "Operations:\n"
             "  copy <name...>             copy files or folders to the destination\n"
             "  move <name...>             move files or folders to the destination\n"
             "  scan [name...]             find duplicates, default is the current directory\n"
             "  cancel                     cancel the running operation\n"
             "  overwrite | skip | overwrite-all | skip-all\n"
             "                             answer a conflict prompt\n"
             "Duplicates:\n"
             "  dupes                      show the last scan result\n"
             "  select <group> <file>      mark a duplicate for transfer\n"
             "  deselect <group> <file>    keep a duplicate behind\n"
             "  transfer uniques|all|selected\n"
             "                             copy part of the scan result to the destination\n"
             "  preview-selected           open the one selected duplicate\n"
             "Cloud:\n"
             "  login <user> | logout\n"
             "  backup <name...>           back up files to the cloud\n"
             "  restore [name...]          restore from the cloud, everything by default\n"
             "  create-account <user> <free|basic|pro>\n"
             "  users                      list accounts\n"
             "  delete-user <user>\n"
             "Other:\n"
             "  state                      show what the client is doing\n"
             "  help | quit\n"
          << std::flush;
}

void CommandInterpreter::listing(Arguments const&)
{
    refreshListing();
}

void CommandInterpreter::changeDirectory(Arguments const& args)
{
    if (args.empty())
        return usage("cd <dir>");

    auto name = joinRest(args, 0);
    if (name == "..")
        return up({});

    if (!name.ends_with('/'))
        name.push_back('/');

    browser_->enter(name, [this](std::expected<void, Client::ClientError> result) {
        if (!result)
            return report(result.error());
        printListing();
    });
}

void CommandInterpreter::up(Arguments const&)
{
    browser_->up([this](std::expected<void, Client::ClientError> result) {
        if (!result)
            return report(result.error());
        printListing();
    });
}

void CommandInterpreter::printWorkingDirectory(Arguments const&)
{
    *out_ << browser_->currentPath() << '\n' << std::flush;
}

void CommandInterpreter::destination(Arguments const& args)
{
    if (!args.empty())
    {
        if (!coordinator_->destinationPath(Persistence::resolvePath(joinRest(args, 0)).string()))
            return;
    }
    *out_ << fmt::format("Destination: {}\n", coordinator_->destinationPath()) << std::flush;
}

void CommandInterpreter::startTransfer(SharedData::OperationKind kind, Arguments const& args)
{
    std::vector<std::string> paths{};
    paths.reserve(args.size());
    for (auto const& name : args)
        paths.push_back(remotePath(name));

    // rejections are reported by the coordinator
    static_cast<void>(coordinator_->start(coordinator_->makeRequest(kind, std::move(paths))));
}

void CommandInterpreter::scan(Arguments const& args)
{
    if (args.empty())
        return startTransfer(SharedData::OperationKind::FindDuplicates, {browser_->currentPath()});
    startTransfer(SharedData::OperationKind::FindDuplicates, args);
}

void CommandInterpreter::restore(Arguments const& args)
{
    startTransfer(SharedData::OperationKind::CloudRestore, args);
}

void CommandInterpreter::decide(Client::ConflictDecision decision)
{
    static_cast<void>(coordinator_->decide(decision));
}

void CommandInterpreter::cancel(Arguments const&)
{
    static_cast<void>(coordinator_->cancel());
}

void CommandInterpreter::duplicates(Arguments const&)
{
    auto const* scan = coordinator_->duplicateScan();
    if (!scan)
        return report(Client::ClientError{
            .type = Client::ClientErrorType::NoScanResult,
            .extraInfo = "Run a duplicate scan first",
        });
    surface_->showDuplicateScanResult(*scan);
}

void CommandInterpreter::select(Arguments const& args, bool selected)
{
    if (args.size() != 2)
        return usage(selected ? "select <group> <file>" : "deselect <group> <file>");

    auto* scan = coordinator_->duplicateScan();
    if (!scan)
        return report(Client::ClientError{
            .type = Client::ClientErrorType::NoScanResult,
            .extraInfo = "Run a duplicate scan first",
        });

    const auto group = parseIndex(args[0]);
    const auto file = parseIndex(args[1]);
    if (!group || !file)
        return usage("group and file are numbers starting at 1");

    if (auto result = scan->select(*group, *file, selected); !result)
        return report(result.error());

    *out_ << fmt::format("{} of {} duplicates selected.\n", scan->selectedCount(), scan->duplicateFileCount())
          << std::flush;
}

void CommandInterpreter::transfer(Arguments const& args)
{
    const auto which = args.empty() ? std::string{} : Utility::Algorithm::toLowerCase(args.front());
    // rejections are reported by the coordinator
    if (which == "uniques")
        static_cast<void>(coordinator_->transferUniques());
    else if (which == "all")
        static_cast<void>(coordinator_->transferAll());
    else if (which == "selected")
        static_cast<void>(coordinator_->transferManualSelection());
    else
        usage("transfer uniques|all|selected");
}

void CommandInterpreter::preview(Arguments const& args)
{
    if (args.empty())
        return usage("preview <file>");

    const auto path = remotePath(joinRest(args, 0));
    preview_->preview(path, [this, path](std::expected<std::filesystem::path, Client::ClientError> result) {
        if (!result)
            return report(result.error());
        *out_ << fmt::format("Opened {} from {}\n", path, result->string()) << std::flush;
    });
}

void CommandInterpreter::previewSelected(Arguments const&)
{
    auto const* scan = coordinator_->duplicateScan();
    if (!scan)
        return report(Client::ClientError{
            .type = Client::ClientErrorType::NoScanResult,
            .extraInfo = "Run a duplicate scan first",
        });

    auto candidate = scan->previewCandidate();
    if (!candidate)
        return report(candidate.error());

    preview({*candidate});
}

void CommandInterpreter::login(Arguments const& args)
{
    if (args.size() != 1)
        return usage("login <user>");

    accounts_->login(args.front(), [this](std::expected<SharedData::Login, Client::ClientError> result) {
        if (!result)
            return report(result.error());

        surface_->notify(Client::Severity::Success, fmt::format("Logged in as {}.", result->user));
        if (result->info)
        {
            *out_ << fmt::format(
                         "Plan: {}, created {}, expires {}\n",
                         result->info->plan,
                         result->info->createdDate(),
                         result->info->expiry)
                  << std::flush;
        }
    });
}

void CommandInterpreter::logout(Arguments const&)
{
    if (!accounts_->currentUser())
        return report(Client::ClientError{
            .type = Client::ClientErrorType::NotAuthenticated,
            .extraInfo = "Nobody is logged in",
        });

    accounts_->logout();
    surface_->notify(Client::Severity::Info, "Logged out.");
}

void CommandInterpreter::createAccount(Arguments const& args)
{
    if (args.size() != 2)
        return usage("create-account <user> <free|basic|pro>");

    accounts_->createAccount(
        args[0],
        Utility::Algorithm::toLowerCase(args[1]),
        [this](std::expected<std::string, Client::ClientError> result) {
            if (!result)
                return report(result.error());
            surface_->notify(Client::Severity::Success, result->empty() ? "Account created." : *result);
        });
}

void CommandInterpreter::users(Arguments const&)
{
    accounts_->listUsers([this](std::expected<std::vector<SharedData::AccountInfo>, Client::ClientError> result) {
        if (!result)
            return report(result.error());

        if (result->empty())
        {
            *out_ << "No accounts.\n" << std::flush;
            return;
        }

        std::string text{};
        for (auto const& account : *result)
        {
            text += fmt::format(
                "  {:<20} {:<6} created {}  expires {}",
                account.userId,
                account.plan,
                account.createdDate(),
                account.expiry);
            if (account.usageGb && account.limitGb)
                text += fmt::format("  {:.2f}/{:.0f} GB", *account.usageGb, *account.limitGb);
            text.push_back('\n');
        }
        *out_ << text << std::flush;
    });
}

void CommandInterpreter::deleteUser(Arguments const& args)
{
    if (args.size() != 1)
        return usage("delete-user <user>");

    accounts_->deleteUser(args.front(), [this](std::expected<std::string, Client::ClientError> result) {
        if (!result)
            return report(result.error());
        surface_->notify(Client::Severity::Success, result->empty() ? "Account deleted." : *result);
    });
}

void CommandInterpreter::state(Arguments const&)
{
    std::string text = fmt::format("State: {}\n", Client::toString(coordinator_->state()));
    if (auto const& session = coordinator_->session(); session)
    {
        text += fmt::format(
            "Operation {}: {} of {} path(s), progress {}/{}\n",
            session->id.shortValue(),
            SharedData::toDisplayString(session->request.kind),
            session->request.sourcePaths.size(),
            session->progressCurrent,
            session->progressTotal);
    }
    if (auto const& conflicts = coordinator_->conflictSession(); conflicts)
    {
        text += fmt::format(
            "Conflict {}/{}: {}\n",
            conflicts->cursor() + 1,
            conflicts->conflictCount(),
            conflicts->currentPath().value_or(""));
    }
    if (auto const& summary = coordinator_->lastSummary(); summary)
    {
        text += fmt::format(
            "Last result: {} {} succeeded, {} failed\n",
            SharedData::toDisplayString(summary->kind),
            summary->succeededCount,
            summary->failedCount);
    }
    text += fmt::format("Destination: {}\n", coordinator_->destinationPath());
    text += fmt::format("User: {}\n", accounts_->currentUser().value_or("(not logged in)"));
    *out_ << text << std::flush;
}

std::string CommandInterpreter::remotePath(std::string const& name) const
{
    if (name.starts_with('/'))
        return name;

    // "DCIM" means the directory "DCIM/" if the listing has one
    auto const& entries = browser_->entries();
    if (!name.ends_with('/'))
    {
        const auto directory = std::find_if(entries.begin(), entries.end(), [&name](auto const& entry) {
            return entry.isDirectory && entry.name == name + '/';
        });
        if (directory != entries.end())
            return browser_->pathOf(directory->name);
    }
    return browser_->pathOf(name);
}

void CommandInterpreter::printListing() const
{
    std::string text{};
    if (auto const& status = browser_->status(); status && !status->message.empty())
        text += fmt::format("{}\n", status->message);

    text += fmt::format("{}\n", browser_->currentPath());
    for (auto const& entry : browser_->entries())
        text += fmt::format("  {:>10}  {}\n", entry.isDirectory ? "<dir>" : entry.size, entry.name);
    *out_ << text << std::flush;
}

void CommandInterpreter::usage(std::string_view text) const
{
    *out_ << fmt::format("Usage: {}\n", text) << std::flush;
}

void CommandInterpreter::report(Client::ClientError const& error) const
{
    Log::debug("Command failed: {}", error.toString());
    surface_->notify(Client::Severity::Error, error.userMessage());
}
