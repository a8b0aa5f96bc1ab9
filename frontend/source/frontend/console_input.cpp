#include <frontend/console_input.hpp>
#include <log/log.hpp>

#include <boost/asio/read_until.hpp>

#include <istream>

#include <unistd.h>

ConsoleInput::ConsoleInput(
    boost::asio::any_io_executor executor,
    std::function<void(std::string const&)> onLine,
    std::function<void()> onEnd)
    : input_{std::move(executor)}
    , buffer_{}
    , onLine_{std::move(onLine)}
    , onEnd_{std::move(onEnd)}
    , stopped_{false}
{}

ConsoleInput::~ConsoleInput()
{
    boost::system::error_code ec;
    input_.close(ec);
}

void ConsoleInput::start()
{
    const int fd = ::dup(STDIN_FILENO);
    if (fd < 0)
    {
        Log::error("Cannot duplicate the standard input descriptor.");
        stopped_ = true;
        return onEnd_();
    }

    boost::system::error_code ec;
    input_.assign(fd, ec);
    if (ec)
    {
        ::close(fd);
        Log::error("Standard input cannot be read asynchronously: {}", ec.message());
        stopped_ = true;
        return onEnd_();
    }

    read();
}

void ConsoleInput::stop()
{
    if (stopped_)
        return;
    stopped_ = true;

    boost::system::error_code ec;
    input_.cancel(ec);
    input_.close(ec);
}

void ConsoleInput::read()
{
    boost::asio::async_read_until(
        input_, buffer_, '\n', [weak = weak_from_this()](boost::system::error_code ec, std::size_t) {
            auto self = weak.lock();
            if (!self || self->stopped_)
                return;

            if (ec)
            {
                if (ec != boost::asio::error::eof)
                    Log::error("Reading standard input failed: {}", ec.message());
                else if (self->buffer_.size() > 0)
                {
                    // last line without a line break
                    std::istream stream{&self->buffer_};
                    std::string line;
                    std::getline(stream, line);
                    self->onLine_(line);
                    if (self->stopped_)
                        return;
                }
                self->stopped_ = true;
                return self->onEnd_();
            }

            std::istream stream{&self->buffer_};
            std::string line;
            std::getline(stream, line);
            self->onLine_(line);

            if (!self->stopped_)
                self->read();
        });
}
