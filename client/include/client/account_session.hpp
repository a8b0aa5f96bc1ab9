#pragma once

#include <client/client_error.hpp>
#include <shared_data/account_info.hpp>
#include <shared_data/error_or_success.hpp>
#include <shared_data/login.hpp>
#include <worker/worker_api.hpp>

#include <array>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Client
{
    class OperationCoordinator;

    /**
     * @brief The cloud account the operator is logged in with, plus account administration.
     * Login and logout are forwarded to the coordinator, which gates the cloud operations on them.
     */
    class AccountSession
    {
      public:
        template <typename T>
        using ResultCallback = std::function<void(std::expected<T, ClientError>)>;

        constexpr static std::array<std::string_view, 3> plans{"free", "basic", "pro"};

        AccountSession(Worker::WorkerApi& api, OperationCoordinator& coordinator);

        void login(std::string const& userId, ResultCallback<SharedData::Login> onDone);
        void logout();

        void createAccount(std::string const& userId, std::string const& plan, ResultCallback<std::string> onDone);

        void listUsers(ResultCallback<std::vector<SharedData::AccountInfo>> onDone);

        /**
         * @brief Deletes an account. Deleting the account that is logged in also logs out.
         */
        void deleteUser(std::string const& userId, ResultCallback<std::string> onDone);

        std::optional<std::string> const& currentUser() const;
        std::optional<SharedData::AccountInfo> const& accountInfo() const;

      private:
        Worker::WorkerApi* api_;
        OperationCoordinator* coordinator_;
        std::optional<std::string> currentUser_;
        std::optional<SharedData::AccountInfo> accountInfo_;
    };
}
