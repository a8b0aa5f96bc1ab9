#pragma once

#include <persistence/state/state.hpp>

#include <gtest/gtest.h>

namespace Persistence::Test
{
    class StateTests : public ::testing::Test
    {};

    TEST_F(StateTests, EmptyObjectLeavesEverythingUnset)
    {
        const auto state = nlohmann::json::object().get<State>();

        EXPECT_FALSE(state.worker.host.has_value());
        EXPECT_FALSE(state.worker.port.has_value());
        EXPECT_FALSE(state.browser.rootPath.has_value());
        EXPECT_FALSE(state.transfer.defaultDestination.has_value());
        EXPECT_FALSE(state.logging.level.has_value());
    }

    TEST_F(StateTests, FullyResolveKeepsExplicitValues)
    {
        const auto state = nlohmann::json::parse(R"({
            "worker": {"port": 6123},
            "logging": {"level": "debug"}
        })")
                               .get<State>()
                               .fullyResolve();

        EXPECT_EQ(state.worker.port, 6123);
        EXPECT_EQ(state.worker.host, "127.0.0.1");
        EXPECT_EQ(state.worker.eventTarget, "/events");
        EXPECT_EQ(state.logging.level, Log::Level::Debug);
        EXPECT_EQ(state.browser.rootPath, "/sdcard/");
        EXPECT_EQ(state.transfer.defaultDestination, "~/PhoneBackup");
    }

    TEST_F(StateTests, UnsetOptionalsAreNotWritten)
    {
        State state{};
        state.worker.port = 7000;

        const nlohmann::json j = state;

        EXPECT_EQ(j["worker"], nlohmann::json({{"port", 7000}}));
        EXPECT_TRUE(j["browser"].empty());
        EXPECT_TRUE(j["logging"].empty());
    }

    TEST_F(StateTests, UnknownLogLevelFallsBackToInfo)
    {
        const auto state = nlohmann::json::parse(R"({"logging": {"level": "chatty"}})").get<State>();

        EXPECT_EQ(state.logging.level, Log::Level::Info);
    }

    TEST_F(StateTests, WrongTypeThrows)
    {
        EXPECT_THROW(nlohmann::json::parse(R"({"worker": {"port": "high"}})").get<State>(), nlohmann::json::exception);
    }
}
