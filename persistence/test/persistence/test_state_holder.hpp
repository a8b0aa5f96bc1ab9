#pragma once

#include <persistence/state_holder.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <string>

namespace Persistence::Test
{
    class StateHolderTests : public ::testing::Test
    {
      public:
        std::filesystem::path configFile() const
        {
            return isolateDirectory_.path() / "courier" / "config.json";
        }

        void writeConfig(std::string const& content)
        {
            std::filesystem::create_directories(configFile().parent_path());
            std::ofstream writer{configFile(), std::ios_base::binary};
            writer << content;
        }

        nlohmann::json readConfig() const
        {
            std::ifstream reader{configFile(), std::ios_base::binary};
            return nlohmann::json::parse(reader);
        }

        std::size_t backupCount() const
        {
            std::size_t count = 0;
            for (auto const& entry : std::filesystem::directory_iterator{configFile().parent_path()})
            {
                if (entry.path().filename().string().starts_with("config.json.backup_"))
                    ++count;
            }
            return count;
        }

      protected:
        Utility::TemporaryDirectory isolateDirectory_{"courier_persistence_test"};
    };

    TEST_F(StateHolderTests, MissingFileIsCreatedWithDefaults)
    {
        StateHolder holder{configFile()};
        bool loaded = false;

        holder.load([&loaded](bool success, StateHolder&) {
            loaded = success;
        });

        ASSERT_TRUE(loaded);
        ASSERT_TRUE(std::filesystem::exists(configFile()));
        EXPECT_EQ(readConfig()["worker"]["port"], 5000);
        EXPECT_EQ(holder.stateCache().browser.rootPath, "/sdcard/");
    }

    TEST_F(StateHolderTests, ExistingValuesSurviveAndDefaultsAreAdded)
    {
        writeConfig(R"({
            // comments are allowed
            "worker": {"host": "10.0.0.2"}
        })");

        StateHolder holder{configFile()};
        holder.load([](bool, StateHolder&) {});

        EXPECT_EQ(holder.stateCache().worker.host, "10.0.0.2");
        EXPECT_EQ(holder.stateCache().worker.port, 5000);

        const auto written = readConfig();
        EXPECT_EQ(written["worker"]["host"], "10.0.0.2");
        EXPECT_EQ(written["transfer"]["defaultDestination"], "~/PhoneBackup");
    }

    TEST_F(StateHolderTests, BrokenFileIsBackedUpAndReplaced)
    {
        writeConfig("{ this is not json");

        StateHolder holder{configFile()};
        bool loaded = false;
        holder.load([&loaded](bool success, StateHolder&) {
            loaded = success;
        });

        EXPECT_TRUE(loaded);
        EXPECT_EQ(backupCount(), 1u);
        EXPECT_EQ(readConfig()["worker"]["host"], "127.0.0.1");
    }

    TEST_F(StateHolderTests, BackupKeepsTheBrokenContent)
    {
        writeConfig("[1, 2,");

        StateHolder holder{configFile()};
        holder.load([](bool, StateHolder&) {});

        for (auto const& entry : std::filesystem::directory_iterator{configFile().parent_path()})
        {
            if (!entry.path().filename().string().starts_with("config.json.backup_"))
                continue;
            std::ifstream reader{entry.path(), std::ios_base::binary};
            EXPECT_EQ(
                (std::string{std::istreambuf_iterator<char>{reader}, std::istreambuf_iterator<char>{}}), "[1, 2,");
        }
        EXPECT_EQ(backupCount(), 1u);
    }

    TEST_F(StateHolderTests, NullDocumentIsTreatedAsMissing)
    {
        writeConfig("null");

        StateHolder holder{configFile()};
        bool loaded = false;
        holder.load([&loaded](bool success, StateHolder&) {
            loaded = success;
        });

        EXPECT_TRUE(loaded);
        EXPECT_EQ(backupCount(), 0u);
        EXPECT_EQ(readConfig()["worker"]["port"], 5000);
    }

    TEST_F(StateHolderTests, WrongTypesReportFailure)
    {
        writeConfig(R"({"worker": {"port": "not a number"}})");

        StateHolder holder{configFile()};
        bool called = false;
        bool loaded = true;
        holder.load([&](bool success, StateHolder&) {
            called = true;
            loaded = success;
        });

        EXPECT_TRUE(called);
        EXPECT_FALSE(loaded);
    }

    TEST_F(StateHolderTests, SaveWritesChangedState)
    {
        StateHolder holder{configFile()};
        holder.load([](bool, StateHolder&) {});

        holder.stateCache().transfer.defaultDestination = "/data/phone";
        bool saved = false;
        holder.save([&saved]() {
            saved = true;
        });

        EXPECT_TRUE(saved);
        EXPECT_EQ(readConfig()["transfer"]["defaultDestination"], "/data/phone");
    }
}
