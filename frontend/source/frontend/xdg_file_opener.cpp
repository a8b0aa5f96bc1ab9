#include <frontend/xdg_file_opener.hpp>
#include <log/log.hpp>

#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>

#include <algorithm>
#include <system_error>

namespace bp = boost::process;

XdgFileOpener::XdgFileOpener(std::string program)
    : program_{std::move(program)}
    , children_{}
{}

XdgFileOpener::~XdgFileOpener()
{
    for (auto& child : children_)
    {
        if (child.valid() && child.joinable())
            child.detach();
    }
}

std::expected<void, Client::ClientError> XdgFileOpener::open(std::filesystem::path const& path)
{
    pruneExited();

    const auto executable = bp::search_path(program_);
    if (executable.empty())
        return std::unexpected(Client::ClientError{
            .type = Client::ClientErrorType::OpenFailed,
            .extraInfo = "Cannot find '" + program_ + "' to open files with",
        });

    std::error_code ec;
    bp::child child{executable, path.string(), bp::std_out > bp::null, bp::std_err > bp::null, ec};
    if (ec)
        return std::unexpected(Client::ClientError{
            .type = Client::ClientErrorType::OpenFailed,
            .extraInfo = "Could not launch " + program_ + ": " + ec.message(),
        });

    Log::info("Opened '{}' with {} (pid {}).", path.string(), program_, child.id());
    children_.push_back(std::move(child));
    return {};
}

void XdgFileOpener::pruneExited()
{
    std::erase_if(children_, [](bp::child& child) {
        std::error_code ec;
        return !child.valid() || !child.running(ec);
    });
}
