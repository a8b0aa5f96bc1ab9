#include <frontend/main.hpp>
#include <persistence/paths.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <string_view>

using namespace std::chrono_literals;

Main::Main(std::filesystem::path configFile)
    : ioContext_{}
    , signals_{ioContext_, SIGINT, SIGTERM}
    , shutdownTimer_{ioContext_}
    , stateHolder_{std::move(configFile)}
    , surface_{std::cout}
    , opener_{}
    , channel_{}
    , api_{}
    , coordinator_{}
    , browser_{}
    , accounts_{}
    , preview_{}
    , interpreter_{}
    , input_{}
    , shuttingDown_{false}
{}

Main::~Main()
{
    // the core holds raw references into each other, tear down in reverse order
    input_.reset();
    interpreter_.reset();
    preview_.reset();
    accounts_.reset();
    browser_.reset();
    coordinator_.reset();
    api_.reset();
    channel_.reset();
}

Persistence::State Main::loadState()
{
    bool loaded = false;
    stateHolder_.load([&loaded](bool success, Persistence::StateHolder&) {
        loaded = success;
    });

    if (!loaded)
    {
        Log::error("Using default settings, '{}' could not be loaded.", stateHolder_.configFile().string());
        return Persistence::State::defaults();
    }
    return stateHolder_.stateCache().fullyResolve();
}

void Main::setupLogging(Persistence::LogOptions const& options)
{
    Log::setLevel(options.level.value_or(Log::Level::Info));

    Log::LoggerOptions loggerOptions{.colorConsole = options.colorConsole.value_or(true)};
    if (options.file)
        loggerOptions.logFile = Persistence::resolvePath(*options.file);
    Log::setup(loggerOptions);
}

void Main::createClient(Persistence::State const& state)
{
    auto const& worker = state.worker;

    channel_ = std::make_shared<Worker::WebSocketEventChannel>(
        ioContext_.get_executor(),
        Worker::WebSocketEventChannelOptions{
            .host = *worker.host,
            .port = *worker.port,
            .target = *worker.eventTarget,
        });
    api_ = std::make_unique<Worker::HttpWorkerApi>(
        ioContext_.get_executor(),
        Worker::HttpWorkerApiOptions{
            .host = *worker.host,
            .port = *worker.port,
        });

    coordinator_ = std::make_unique<Client::OperationCoordinator>(*channel_, surface_);
    browser_ = std::make_unique<Client::RemoteBrowser>(*api_, *coordinator_, *state.browser.rootPath);
    accounts_ = std::make_unique<Client::AccountSession>(*api_, *coordinator_);
    preview_ = std::make_unique<Client::PreviewService>(*api_, *coordinator_, opener_);
    interpreter_ =
        std::make_unique<CommandInterpreter>(*coordinator_, *browser_, *accounts_, *preview_, surface_, std::cout);

    const auto destination = Persistence::resolvePath(*state.transfer.defaultDestination);
    if (!coordinator_->destinationPath(destination.string()))
        Log::warn("Default destination '{}' was not accepted.", destination.string());

    channel_->onEvent([this](std::string const& event, nlohmann::json const& payload) {
        if (auto result = coordinator_->onChannelEvent(event, payload); !result)
            Log::debug("Event '{}' was rejected: {}", event, result.error().toString());
    });
    channel_->onConnectionChange([this](bool connected) {
        coordinator_->onConnectionChange(connected);
    });
    surface_.onListingRefreshRequested([this]() {
        interpreter_->refreshListing();
    });
}

void Main::connectChannel()
{
    channel_->connect([this](std::expected<void, Worker::ChannelError> result) {
        if (!result)
        {
            Log::error("Could not connect to the worker: {}", result.error().toString());
            surface_.notify(Client::Severity::Error, "Could not connect to the worker. Is it running?");
        }
        else
            surface_.notify(Client::Severity::Success, "Connected to the worker.");

        interpreter_->refreshListing();
    });
}

int Main::run()
{
    const auto state = loadState();
    setupLogging(state.logging);
    Log::info("Configuration loaded from '{}'.", stateHolder_.configFile().string());

    createClient(state);

    signals_.async_wait([this](boost::system::error_code ec, int signal) {
        if (ec)
            return;
        Log::info("Received signal {}, shutting down.", signal);
        shutdown();
    });

    input_ = std::make_shared<ConsoleInput>(
        ioContext_.get_executor(),
        [this](std::string const& line) {
            if (interpreter_->execute(line) == CommandInterpreter::Outcome::Quit)
                shutdown();
        },
        [this]() {
            shutdown();
        });

    std::cout << "courier - type 'help' for a list of commands.\n" << std::flush;
    connectChannel();
    input_->start();

    ioContext_.run();
    return 0;
}

void Main::shutdown()
{
    if (shuttingDown_)
        return;
    shuttingDown_ = true;

    if (coordinator_ && !coordinator_->isIdle())
        Log::warn("Leaving while an operation runs, the worker continues on its own.");

    signals_.cancel();
    if (input_)
        input_->stop();
    if (channel_)
        channel_->close();

    // a worker that never answers the close handshake must not keep us alive
    shutdownTimer_.expires_after(2s);
    shutdownTimer_.async_wait([this](boost::system::error_code ec) {
        if (!ec)
            ioContext_.stop();
    });
}

namespace
{
    struct CommandLine
    {
        std::filesystem::path configFile{};
        bool help{false};
    };

    std::optional<CommandLine> parseCommandLine(int argc, char const* const* argv)
    {
        CommandLine commandLine{.configFile = Persistence::defaultConfigPath()};
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg{argv[i]};
            if (arg == "--help" || arg == "-h")
                commandLine.help = true;
            else if (arg == "--config" && i + 1 < argc)
                commandLine.configFile = Persistence::resolvePath(argv[++i]);
            else if (arg.starts_with("--config="))
                commandLine.configFile = Persistence::resolvePath(arg.substr(9));
            else
            {
                std::cerr << fmt::format("Unknown argument '{}'.\n", arg);
                return std::nullopt;
            }
        }
        return commandLine;
    }
}

int main(int argc, char** argv)
{
    const auto commandLine = parseCommandLine(argc, argv);
    if (!commandLine || commandLine->help)
    {
        std::cout << "Usage: courier [--config <file>]\n"
                  << fmt::format(
                         "  --config <file>  settings file, default {}\n", Persistence::defaultConfigPath().string());
        return commandLine ? 0 : 1;
    }

    try
    {
        Main app{commandLine->configFile};
        return app.run();
    }
    catch (std::exception const& e)
    {
        Log::critical("Fatal: {}", e.what());
        std::cerr << "courier: " << e.what() << '\n';
        return 1;
    }
}
