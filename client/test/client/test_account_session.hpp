#pragma once

#include <client/account_session.hpp>
#include <client/operation_coordinator.hpp>
#include <client/mocks/control_surface_mock.hpp>
#include <worker/mocks/event_channel_mock.hpp>
#include <worker/mocks/worker_api_mock.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <optional>
#include <string>
#include <vector>

namespace Client::Test
{
    class AccountSessionTests : public ::testing::Test
    {
      protected:
        template <typename T>
        static AccountSession::ResultCallback<T> storeIn(std::optional<std::expected<T, ClientError>>& target)
        {
            return [&target](std::expected<T, ClientError> result) {
                target = std::move(result);
            };
        }

        void loginAlice()
        {
            ON_CALL(api_, login("alice", ::testing::_))
                .WillByDefault([](std::string const&, Worker::ApiCallback<SharedData::Login> cb) {
                    cb(SharedData::Login{
                        .user = "alice",
                        .info = SharedData::AccountInfo{.userId = "alice", .plan = "basic"},
                    });
                });
            std::optional<std::expected<SharedData::Login, ClientError>> result{};
            session_.login("alice", storeIn(result));
            ASSERT_TRUE(result.has_value());
            ASSERT_TRUE(result->has_value());
        }

      protected:
        ::testing::NiceMock<Worker::Test::EventChannelMock> channel_{};
        ::testing::NiceMock<ControlSurfaceMock> surface_{};
        ::testing::NiceMock<Worker::Test::WorkerApiMock> api_{};
        OperationCoordinator coordinator_{channel_, surface_};
        AccountSession session_{api_, coordinator_};
    };

    TEST_F(AccountSessionTests, LoginAuthenticatesTheCoordinator)
    {
        EXPECT_CALL(surface_, cloudControlsEnabled(true)).Times(1);

        loginAlice();

        EXPECT_EQ(session_.currentUser().value_or(""), "alice");
        EXPECT_EQ(coordinator_.authenticatedUser().value_or(""), "alice");
        ASSERT_TRUE(session_.accountInfo().has_value());
        EXPECT_EQ(session_.accountInfo()->plan, "basic");
    }

    TEST_F(AccountSessionTests, EmptyUserIdIsRejectedWithoutAsking)
    {
        EXPECT_CALL(api_, login(::testing::_, ::testing::_)).Times(0);
        std::optional<std::expected<SharedData::Login, ClientError>> result{};

        session_.login("", storeIn(result));

        ASSERT_TRUE(result.has_value());
        ASSERT_FALSE(result->has_value());
        EXPECT_EQ(result->error().type, ClientErrorType::InvalidRequest);
    }

    TEST_F(AccountSessionTests, RejectedLoginCarriesTheWorkerMessage)
    {
        ON_CALL(api_, login(::testing::_, ::testing::_))
            .WillByDefault([](std::string const&, Worker::ApiCallback<SharedData::Login> cb) {
                cb(std::unexpected(Worker::ApiError{
                    .type = Worker::ApiErrorType::WorkerError,
                    .httpStatus = 401,
                    .extraInfo = "Invalid user ID or account expired.",
                }));
            });
        std::optional<std::expected<SharedData::Login, ClientError>> result{};

        session_.login("mallory", storeIn(result));

        ASSERT_TRUE(result.has_value());
        ASSERT_FALSE(result->has_value());
        EXPECT_EQ(result->error().type, ClientErrorType::ApiFailure);
        EXPECT_EQ(result->error().userMessage(), "Invalid user ID or account expired.");
        EXPECT_FALSE(session_.currentUser().has_value());
        EXPECT_FALSE(coordinator_.authenticatedUser().has_value());
    }

    TEST_F(AccountSessionTests, LogoutRevokesCloudAccess)
    {
        loginAlice();
        EXPECT_CALL(surface_, cloudControlsEnabled(false)).Times(1);

        session_.logout();

        EXPECT_FALSE(session_.currentUser().has_value());
        EXPECT_FALSE(session_.accountInfo().has_value());
        EXPECT_FALSE(coordinator_.authenticatedUser().has_value());
    }

    TEST_F(AccountSessionTests, UnknownPlanIsRejected)
    {
        EXPECT_CALL(api_, createAccount(::testing::_, ::testing::_, ::testing::_)).Times(0);
        std::optional<std::expected<std::string, ClientError>> result{};

        session_.createAccount("bob", "platinum", storeIn(result));

        ASSERT_TRUE(result.has_value());
        ASSERT_FALSE(result->has_value());
        EXPECT_EQ(result->error().type, ClientErrorType::InvalidRequest);
    }

    TEST_F(AccountSessionTests, CreateAccountReturnsTheWorkerMessage)
    {
        EXPECT_CALL(api_, createAccount("bob", "pro", ::testing::_))
            .WillOnce([](std::string const&, std::string const&, Worker::ApiCallback<SharedData::Message> cb) {
                cb(SharedData::Message{.message = "Account created successfully"});
            });
        std::optional<std::expected<std::string, ClientError>> result{};

        session_.createAccount("bob", "pro", storeIn(result));

        ASSERT_TRUE(result.has_value());
        ASSERT_TRUE(result->has_value());
        EXPECT_EQ(**result, "Account created successfully");
    }

    TEST_F(AccountSessionTests, ListUsersPassesTheAccountsThrough)
    {
        EXPECT_CALL(api_, adminUsers(::testing::_))
            .WillOnce([](Worker::ApiCallback<std::vector<SharedData::AccountInfo>> cb) {
                cb(std::vector<SharedData::AccountInfo>{
                    {.userId = "alice", .plan = "basic"},
                    {.userId = "bob", .plan = "pro"},
                });
            });
        std::optional<std::expected<std::vector<SharedData::AccountInfo>, ClientError>> result{};

        session_.listUsers(storeIn(result));

        ASSERT_TRUE(result.has_value());
        ASSERT_TRUE(result->has_value());
        ASSERT_EQ((*result)->size(), 2u);
        EXPECT_EQ((*result)->at(1).userId, "bob");
    }

    TEST_F(AccountSessionTests, DeletingTheCurrentUserLogsOut)
    {
        loginAlice();
        ON_CALL(api_, adminDeleteUser("alice", ::testing::_))
            .WillByDefault([](std::string const&, Worker::ApiCallback<SharedData::Message> cb) {
                cb(SharedData::Message{.message = "User deleted"});
            });
        std::optional<std::expected<std::string, ClientError>> result{};

        session_.deleteUser("alice", storeIn(result));

        ASSERT_TRUE(result.has_value());
        ASSERT_TRUE(result->has_value());
        EXPECT_FALSE(session_.currentUser().has_value());
        EXPECT_FALSE(coordinator_.authenticatedUser().has_value());
    }

    TEST_F(AccountSessionTests, DeletingAnotherUserKeepsTheLogin)
    {
        loginAlice();
        ON_CALL(api_, adminDeleteUser("bob", ::testing::_))
            .WillByDefault([](std::string const&, Worker::ApiCallback<SharedData::Message> cb) {
                cb(SharedData::Message{.message = "User deleted"});
            });
        std::optional<std::expected<std::string, ClientError>> result{};

        session_.deleteUser("bob", storeIn(result));

        ASSERT_TRUE(result.has_value());
        EXPECT_TRUE(result->has_value());
        EXPECT_EQ(session_.currentUser().value_or(""), "alice");
    }
}
