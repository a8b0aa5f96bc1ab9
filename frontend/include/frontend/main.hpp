#pragma once

#include <frontend/command_interpreter.hpp>
#include <frontend/console_control_surface.hpp>
#include <frontend/console_input.hpp>
#include <frontend/xdg_file_opener.hpp>
#include <client/account_session.hpp>
#include <client/operation_coordinator.hpp>
#include <client/preview_service.hpp>
#include <client/remote_browser.hpp>
#include <persistence/state_holder.hpp>
#include <worker/http_worker_api.hpp>
#include <worker/websocket_event_channel.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <filesystem>
#include <memory>

class Main
{
  public:
    explicit Main(std::filesystem::path configFile);
    ~Main();

    Main(Main const&) = delete;
    Main& operator=(Main const&) = delete;
    Main(Main&&) = delete;
    Main& operator=(Main&&) = delete;

    /**
     * @brief Loads the configuration, connects to the worker and processes console input until the operator
     * quits or input ends.
     */
    int run();

  private:
    Persistence::State loadState();
    void setupLogging(Persistence::LogOptions const& options);
    void createClient(Persistence::State const& state);
    void connectChannel();
    void shutdown();

  private:
    boost::asio::io_context ioContext_;
    boost::asio::signal_set signals_;
    boost::asio::steady_timer shutdownTimer_;
    Persistence::StateHolder stateHolder_;
    ConsoleControlSurface surface_;
    XdgFileOpener opener_;
    std::shared_ptr<Worker::WebSocketEventChannel> channel_;
    std::unique_ptr<Worker::HttpWorkerApi> api_;
    std::unique_ptr<Client::OperationCoordinator> coordinator_;
    std::unique_ptr<Client::RemoteBrowser> browser_;
    std::unique_ptr<Client::AccountSession> accounts_;
    std::unique_ptr<Client::PreviewService> preview_;
    std::unique_ptr<CommandInterpreter> interpreter_;
    std::shared_ptr<ConsoleInput> input_;
    bool shuttingDown_;
};
