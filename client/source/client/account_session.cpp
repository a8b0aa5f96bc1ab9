#include <client/account_session.hpp>
#include <client/operation_coordinator.hpp>
#include <log/log.hpp>

#include <algorithm>

namespace Client
{
    namespace
    {
        std::optional<ClientError> validateUserId(std::string const& userId)
        {
            if (userId.empty())
                return ClientError{.type = ClientErrorType::InvalidRequest, .extraInfo = "Please enter a user ID"};
            return std::nullopt;
        }

        ClientError toClientError(Worker::ApiError const& error)
        {
            return ClientError{.type = ClientErrorType::ApiFailure, .extraInfo = error.userMessage()};
        }
    }

    AccountSession::AccountSession(Worker::WorkerApi& api, OperationCoordinator& coordinator)
        : api_{&api}
        , coordinator_{&coordinator}
        , currentUser_{}
        , accountInfo_{}
    {}

    void AccountSession::login(std::string const& userId, ResultCallback<SharedData::Login> onDone)
    {
        if (auto error = validateUserId(userId); error)
            return onDone(std::unexpected(std::move(*error)));

        api_->login(
            userId,
            [this, userId, onDone = std::move(onDone)](std::expected<SharedData::Login, Worker::ApiError> reply) {
                if (!reply)
                {
                    Log::warn("Login of '{}' failed: {}", userId, reply.error().toString());
                    return onDone(std::unexpected(toClientError(reply.error())));
                }

                if (reply->user.empty())
                    reply->user = userId;

                currentUser_ = reply->user;
                accountInfo_ = reply->info;
                Log::info("Logged in as '{}'.", *currentUser_);
                coordinator_->authenticatedUser(currentUser_);
                onDone(std::move(*reply));
            });
    }

    void AccountSession::logout()
    {
        if (!currentUser_)
            return;

        Log::info("Logged out '{}'.", *currentUser_);
        currentUser_.reset();
        accountInfo_.reset();
        coordinator_->authenticatedUser(std::nullopt);
    }

    void AccountSession::createAccount(
        std::string const& userId,
        std::string const& plan,
        ResultCallback<std::string> onDone)
    {
        if (auto error = validateUserId(userId); error)
            return onDone(std::unexpected(std::move(*error)));

        if (std::find(plans.begin(), plans.end(), plan) == plans.end())
            return onDone(std::unexpected(ClientError{
                .type = ClientErrorType::InvalidRequest,
                .extraInfo = "Invalid plan selected, choose free, basic or pro",
            }));

        api_->createAccount(
            userId,
            plan,
            [userId, onDone = std::move(onDone)](std::expected<SharedData::Message, Worker::ApiError> reply) {
                if (!reply)
                {
                    Log::warn("Creating account '{}' failed: {}", userId, reply.error().toString());
                    return onDone(std::unexpected(toClientError(reply.error())));
                }
                Log::info("Account '{}' created.", userId);
                onDone(std::move(reply->message));
            });
    }

    void AccountSession::listUsers(ResultCallback<std::vector<SharedData::AccountInfo>> onDone)
    {
        api_->adminUsers(
            [onDone = std::move(onDone)](std::expected<std::vector<SharedData::AccountInfo>, Worker::ApiError> users) {
                if (!users)
                {
                    Log::warn("Listing accounts failed: {}", users.error().toString());
                    return onDone(std::unexpected(toClientError(users.error())));
                }
                onDone(std::move(*users));
            });
    }

    void AccountSession::deleteUser(std::string const& userId, ResultCallback<std::string> onDone)
    {
        if (auto error = validateUserId(userId); error)
            return onDone(std::unexpected(std::move(*error)));

        api_->adminDeleteUser(
            userId,
            [this, userId, onDone = std::move(onDone)](std::expected<SharedData::Message, Worker::ApiError> reply) {
                if (!reply)
                {
                    Log::warn("Deleting account '{}' failed: {}", userId, reply.error().toString());
                    return onDone(std::unexpected(toClientError(reply.error())));
                }

                Log::info("Account '{}' deleted.", userId);
                if (currentUser_ == userId)
                    logout();
                onDone(std::move(reply->message));
            });
    }

    std::optional<std::string> const& AccountSession::currentUser() const
    {
        return currentUser_;
    }

    std::optional<SharedData::AccountInfo> const& AccountSession::accountInfo() const
    {
        return accountInfo_;
    }
}
