#include <utility/temporary_directory.hpp>

#include <stdlib.h>

#include <stdexcept>
#include <system_error>

namespace Utility
{
    TemporaryDirectory::TemporaryDirectory(std::string const& prefix)
        : path_{}
    {
        std::string pattern{(std::filesystem::temp_directory_path() / (prefix + "_XXXXXX")).string()};
        if (mkdtemp(pattern.data()) == nullptr || !std::filesystem::is_directory(pattern))
            throw std::runtime_error("Could not setup temporary directory: " + pattern);
        path_ = pattern;
    }
    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(path_, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return path_;
    }
}
