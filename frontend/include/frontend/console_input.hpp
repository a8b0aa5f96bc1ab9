#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/streambuf.hpp>

#include <functional>
#include <memory>
#include <string>

/**
 * @brief Reads standard input line by line on the io context.
 * Must be owned by a std::shared_ptr.
 */
class ConsoleInput : public std::enable_shared_from_this<ConsoleInput>
{
  public:
    ConsoleInput(
        boost::asio::any_io_executor executor,
        std::function<void(std::string const&)> onLine,
        std::function<void()> onEnd);
    ~ConsoleInput();

    ConsoleInput(ConsoleInput const&) = delete;
    ConsoleInput& operator=(ConsoleInput const&) = delete;
    ConsoleInput(ConsoleInput&&) = delete;
    ConsoleInput& operator=(ConsoleInput&&) = delete;

    /**
     * @brief Starts reading. onEnd is called once input is exhausted or cannot be read.
     */
    void start();
    void stop();

  private:
    void read();

  private:
    boost::asio::posix::stream_descriptor input_;
    boost::asio::streambuf buffer_;
    std::function<void(std::string const&)> onLine_;
    std::function<void()> onEnd_;
    bool stopped_;
};
