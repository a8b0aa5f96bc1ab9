#pragma once

#include <client/file_opener.hpp>

#include <gmock/gmock.h>

namespace Client::Test
{
    class FileOpenerMock : public Client::FileOpener
    {
      public:
        MOCK_METHOD((std::expected<void, ClientError>), open, (std::filesystem::path const& path), (override));
    };
}
