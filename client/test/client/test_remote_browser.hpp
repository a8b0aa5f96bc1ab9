#pragma once

#include <client/remote_browser.hpp>
#include <client/operation_coordinator.hpp>
#include <client/mocks/control_surface_mock.hpp>
#include <worker/mocks/event_channel_mock.hpp>
#include <worker/mocks/worker_api_mock.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace Client::Test
{
    class RemoteBrowserTests : public ::testing::Test
    {
      protected:
        using Listing = std::vector<SharedData::DirectoryEntry>;

        void SetUp() override
        {
            ON_CALL(channel_, emit(::testing::_, ::testing::_))
                .WillByDefault([](auto, auto const&) -> std::expected<void, Worker::ChannelError> {
                    return {};
                });
            ON_CALL(api_, status(::testing::_)).WillByDefault([](Worker::ApiCallback<SharedData::WorkerStatus> cb) {
                cb(SharedData::WorkerStatus{
                    .level = SharedData::WorkerStatusLevel::Success, .message = "Connected to: Pixel"});
            });
            ON_CALL(api_, listPath(::testing::_, ::testing::_))
                .WillByDefault([this](std::string const& path, Worker::ApiCallback<Listing> cb) {
                    listedPaths_.push_back(path);
                    cb(listings_.contains(path) ? listings_[path] : Listing{});
                });
            ASSERT_TRUE(coordinator_.destinationPath("/home/user/PhoneBackup").has_value());
        }

        std::expected<void, ClientError> refresh()
        {
            std::optional<std::expected<void, ClientError>> result{};
            browser_.refresh([&result](auto r) {
                result = std::move(r);
            });
            if (!result)
                throw std::runtime_error("refresh did not complete");
            return *result;
        }

        std::expected<void, ClientError> enter(std::string const& name)
        {
            std::optional<std::expected<void, ClientError>> result{};
            browser_.enter(name, [&result](auto r) {
                result = std::move(r);
            });
            if (!result)
                throw std::runtime_error("enter did not complete");
            return *result;
        }

        std::expected<void, ClientError> up()
        {
            std::optional<std::expected<void, ClientError>> result{};
            browser_.up([&result](auto r) {
                result = std::move(r);
            });
            if (!result)
                throw std::runtime_error("up did not complete");
            return *result;
        }

      protected:
        ::testing::NiceMock<Worker::Test::EventChannelMock> channel_{};
        ::testing::NiceMock<ControlSurfaceMock> surface_{};
        ::testing::NiceMock<Worker::Test::WorkerApiMock> api_{};
        OperationCoordinator coordinator_{channel_, surface_};
        RemoteBrowser browser_{api_, coordinator_, "/sdcard/"};
        std::unordered_map<std::string, Listing> listings_{
            {"/sdcard/",
             {
                 {.name = "DCIM/", .size = "-", .isDirectory = true},
                 {.name = "notes.txt", .size = "1.2 KB", .isDirectory = false},
             }},
            {"/sdcard/DCIM/", {{.name = "Camera/", .size = "-", .isDirectory = true}}},
            {"/sdcard/DCIM/Camera/", {{.name = "IMG_0001.jpg", .size = "3.4 MB", .isDirectory = false}}},
        };
        std::vector<std::string> listedPaths_{};
    };

    TEST_F(RemoteBrowserTests, StartsAtTheRoot)
    {
        EXPECT_EQ(browser_.currentPath(), "/sdcard/");
        EXPECT_EQ(browser_.rootPath(), "/sdcard/");
        EXPECT_TRUE(browser_.entries().empty());
    }

    TEST_F(RemoteBrowserTests, RefreshListsTheCurrentDirectory)
    {
        ASSERT_TRUE(refresh().has_value());

        ASSERT_EQ(browser_.entries().size(), 2u);
        EXPECT_EQ(browser_.entries()[0].name, "DCIM/");
        ASSERT_TRUE(browser_.status().has_value());
        EXPECT_TRUE(browser_.status()->usable());
    }

    TEST_F(RemoteBrowserTests, UnusablePhoneClearsTheListingWithoutListing)
    {
        ASSERT_TRUE(refresh().has_value());
        ON_CALL(api_, status(::testing::_)).WillByDefault([](Worker::ApiCallback<SharedData::WorkerStatus> cb) {
            cb(SharedData::WorkerStatus{.level = SharedData::WorkerStatusLevel::Warning, .message = "No device"});
        });
        listedPaths_.clear();

        ASSERT_TRUE(refresh().has_value());

        EXPECT_TRUE(browser_.entries().empty());
        EXPECT_TRUE(listedPaths_.empty());
        EXPECT_EQ(browser_.status()->message, "No device");
    }

    TEST_F(RemoteBrowserTests, UnreachableWorkerIsReported)
    {
        ON_CALL(api_, status(::testing::_)).WillByDefault([](Worker::ApiCallback<SharedData::WorkerStatus> cb) {
            cb(std::unexpected(Worker::ApiError{.type = Worker::ApiErrorType::ConnectionFailed}));
        });

        const auto result = refresh();

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, ClientErrorType::ApiFailure);
        EXPECT_EQ(browser_.status()->level, SharedData::WorkerStatusLevel::Error);
        EXPECT_TRUE(browser_.entries().empty());
    }

    TEST_F(RemoteBrowserTests, EnterAndUpWalkTheTree)
    {
        ASSERT_TRUE(refresh().has_value());

        ASSERT_TRUE(enter("DCIM/").has_value());
        ASSERT_TRUE(enter("Camera/").has_value());
        EXPECT_EQ(browser_.currentPath(), "/sdcard/DCIM/Camera/");
        EXPECT_EQ(browser_.pathOf("IMG_0001.jpg"), "/sdcard/DCIM/Camera/IMG_0001.jpg");

        ASSERT_TRUE(up().has_value());
        EXPECT_EQ(browser_.currentPath(), "/sdcard/DCIM/");
        ASSERT_TRUE(up().has_value());
        EXPECT_EQ(browser_.currentPath(), "/sdcard/");

        EXPECT_EQ(
            listedPaths_,
            (std::vector<std::string>{"/sdcard/", "/sdcard/DCIM/", "/sdcard/DCIM/Camera/", "/sdcard/DCIM/", "/sdcard/"}));
    }

    TEST_F(RemoteBrowserTests, UpAtTheRootIsRejected)
    {
        const auto result = up();

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, ClientErrorType::InvalidRequest);
        EXPECT_EQ(browser_.currentPath(), "/sdcard/");
    }

    TEST_F(RemoteBrowserTests, EnteringAFileIsRejected)
    {
        ASSERT_TRUE(refresh().has_value());

        const auto result = enter("notes.txt");

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, ClientErrorType::InvalidRequest);
        EXPECT_EQ(browser_.currentPath(), "/sdcard/");
    }

    TEST_F(RemoteBrowserTests, NavigationIsRefusedWhileAnOperationRuns)
    {
        ASSERT_TRUE(refresh().has_value());
        ASSERT_TRUE(coordinator_.start(coordinator_.makeRequest(SharedData::OperationKind::Copy, {"/sdcard/notes.txt"}))
                        .has_value());

        const auto result = enter("DCIM/");

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, ClientErrorType::NotIdle);
        EXPECT_EQ(browser_.currentPath(), "/sdcard/");
    }

    TEST_F(RemoteBrowserTests, RepliesToAnOlderRefreshAreDiscarded)
    {
        std::vector<Worker::ApiCallback<SharedData::WorkerStatus>> pending{};
        EXPECT_CALL(api_, status(::testing::_))
            .Times(2)
            .WillRepeatedly([&pending](Worker::ApiCallback<SharedData::WorkerStatus> cb) {
                pending.push_back(std::move(cb));
            });

        int firstDone = 0;
        int secondDone = 0;
        browser_.refresh([&firstDone](auto) {
            ++firstDone;
        });
        browser_.refresh([&secondDone](auto) {
            ++secondDone;
        });
        ASSERT_EQ(pending.size(), 2u);

        pending[0](SharedData::WorkerStatus{.level = SharedData::WorkerStatusLevel::Success});
        EXPECT_EQ(firstDone, 0);
        EXPECT_TRUE(listedPaths_.empty());

        pending[1](SharedData::WorkerStatus{.level = SharedData::WorkerStatusLevel::Success});
        EXPECT_EQ(secondDone, 1);
        EXPECT_EQ(browser_.entries().size(), 2u);
    }
}
