#pragma once

#include <worker/worker_api.hpp>

#include <gmock/gmock.h>

namespace Worker::Test
{
    class WorkerApiMock : public Worker::WorkerApi
    {
      public:
        MOCK_METHOD(void, status, (ApiCallback<SharedData::WorkerStatus> onResult), (override));
        MOCK_METHOD(
            void,
            listPath,
            (std::string const& path, ApiCallback<std::vector<SharedData::DirectoryEntry>> onResult),
            (override));
        MOCK_METHOD(
            void,
            previewFile,
            (std::string const& path, ApiCallback<SharedData::PreviewFile> onResult),
            (override));
        MOCK_METHOD(
            void,
            createAccount,
            (std::string const& userId, std::string const& plan, ApiCallback<SharedData::Message> onResult),
            (override));
        MOCK_METHOD(void, login, (std::string const& userId, ApiCallback<SharedData::Login> onResult), (override));
        MOCK_METHOD(void, adminUsers, (ApiCallback<std::vector<SharedData::AccountInfo>> onResult), (override));
        MOCK_METHOD(
            void,
            adminDeleteUser,
            (std::string const& userId, ApiCallback<SharedData::Message> onResult),
            (override));
    };
}
