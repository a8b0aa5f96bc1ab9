#pragma once

#include <client/client_error.hpp>

#include <expected>
#include <filesystem>

namespace Client
{
    /**
     * @brief Hands a local file to whatever the desktop opens it with.
     */
    class FileOpener
    {
      public:
        FileOpener() = default;
        virtual ~FileOpener() = default;
        FileOpener(FileOpener const&) = delete;
        FileOpener& operator=(FileOpener const&) = delete;
        FileOpener(FileOpener&&) = delete;
        FileOpener& operator=(FileOpener&&) = delete;

        virtual std::expected<void, ClientError> open(std::filesystem::path const& path) = 0;
    };
}
