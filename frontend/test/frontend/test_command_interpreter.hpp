#pragma once

#include <frontend/command_interpreter.hpp>
#include <frontend/console_control_surface.hpp>
#include <client/mocks/file_opener_mock.hpp>
#include <worker/mocks/event_channel_mock.hpp>
#include <worker/mocks/worker_api_mock.hpp>
#include <shared_data/events.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace Test
{
    using ::testing::_;

    class CommandInterpreterTests : public ::testing::Test
    {
      protected:
        using Listing = std::vector<SharedData::DirectoryEntry>;

        void SetUp() override
        {
            ON_CALL(channel_, emit(_, _))
                .WillByDefault(
                    [this](std::string_view event, nlohmann::json const& payload)
                        -> std::expected<void, Worker::ChannelError> {
                        emitted_.emplace_back(std::string{event}, payload);
                        return {};
                    });
            ON_CALL(api_, status(_)).WillByDefault([](Worker::ApiCallback<SharedData::WorkerStatus> cb) {
                cb(SharedData::WorkerStatus{.level = SharedData::WorkerStatusLevel::Success});
            });
            ON_CALL(api_, listPath(_, _)).WillByDefault([](std::string const&, Worker::ApiCallback<Listing> cb) {
                cb(Listing{
                    {.name = "DCIM/", .size = "-", .isDirectory = true},
                    {.name = "my notes.txt", .size = "1 KB", .isDirectory = false},
                });
            });
            ASSERT_TRUE(coordinator_.destinationPath("/home/user/PhoneBackup").has_value());
            interpreter_.refreshListing();
            out_.str("");
        }

      protected:
        ::testing::NiceMock<Worker::Test::EventChannelMock> channel_{};
        ::testing::NiceMock<Worker::Test::WorkerApiMock> api_{};
        ::testing::NiceMock<Client::Test::FileOpenerMock> opener_{};
        std::ostringstream out_{};
        ConsoleControlSurface surface_{out_};
        Client::OperationCoordinator coordinator_{channel_, surface_};
        Client::RemoteBrowser browser_{api_, coordinator_, "/sdcard/"};
        Client::AccountSession accounts_{api_, coordinator_};
        Client::PreviewService preview_{api_, coordinator_, opener_};
        CommandInterpreter interpreter_{coordinator_, browser_, accounts_, preview_, surface_, out_};
        std::vector<std::pair<std::string, nlohmann::json>> emitted_{};
    };

    TEST_F(CommandInterpreterTests, TokenizeHonorsQuotesAndEscapes)
    {
        EXPECT_EQ(
            CommandInterpreter::tokenize(R"(copy "my notes.txt" a\ b.jpg  c)"),
            (std::vector<std::string>{"copy", "my notes.txt", "a b.jpg", "c"}));
        EXPECT_EQ(CommandInterpreter::tokenize(R"(login "")"), (std::vector<std::string>{"login", ""}));
        EXPECT_TRUE(CommandInterpreter::tokenize("   ").empty());
    }

    TEST_F(CommandInterpreterTests, QuitEndsTheSession)
    {
        EXPECT_EQ(interpreter_.execute("quit"), CommandInterpreter::Outcome::Quit);
        EXPECT_EQ(interpreter_.execute("  EXIT "), CommandInterpreter::Outcome::Quit);
        EXPECT_EQ(interpreter_.execute(""), CommandInterpreter::Outcome::Continue);
    }

    TEST_F(CommandInterpreterTests, UnknownCommandIsReported)
    {
        EXPECT_EQ(interpreter_.execute("teleport now"), CommandInterpreter::Outcome::Continue);

        EXPECT_NE(out_.str().find("Unknown command 'teleport'"), std::string::npos);
        EXPECT_TRUE(emitted_.empty());
    }

    TEST_F(CommandInterpreterTests, CopyResolvesNamesAgainstTheCurrentDirectory)
    {
        interpreter_.execute(R"(COPY DCIM "my notes.txt" /sdcard/Music/)");

        ASSERT_EQ(emitted_.size(), 1u);
        EXPECT_EQ(emitted_[0].first, SharedData::Events::startOperation);
        EXPECT_EQ(emitted_[0].second["operation"], "copy");
        EXPECT_EQ(
            emitted_[0].second["paths"],
            (nlohmann::json{"/sdcard/DCIM/", "/sdcard/my notes.txt", "/sdcard/Music/"}));
        EXPECT_EQ(emitted_[0].second["dest_folder"], "/home/user/PhoneBackup");
    }

    TEST_F(CommandInterpreterTests, ScanDefaultsToTheCurrentDirectory)
    {
        interpreter_.execute("scan");

        ASSERT_EQ(emitted_.size(), 1u);
        EXPECT_EQ(emitted_[0].second["operation"], "find_duplicates");
        EXPECT_EQ(emitted_[0].second["paths"], (nlohmann::json{"/sdcard/"}));
    }

    TEST_F(CommandInterpreterTests, ConflictAnswersReachTheCoordinator)
    {
        interpreter_.execute("move DCIM");
        ASSERT_TRUE(coordinator_
                        .onChannelEvent(
                            std::string{SharedData::Events::askForOverwrite},
                            {{"conflicts", {"/sdcard/DCIM/a.jpg", "/sdcard/DCIM/b.jpg"}}, {"is_move_op", true}})
                        .has_value());
        EXPECT_TRUE(surface_.conflictPromptOpen());

        interpreter_.execute("overwrite");
        interpreter_.execute("skip");

        ASSERT_EQ(emitted_.size(), 2u);
        EXPECT_EQ(emitted_[1].first, SharedData::Events::resolveConflicts);
        EXPECT_EQ(emitted_[1].second["to_overwrite"], (nlohmann::json{"/sdcard/DCIM/a.jpg"}));
        EXPECT_EQ(emitted_[1].second["is_move_op"], true);
        EXPECT_FALSE(surface_.conflictPromptOpen());
    }

    TEST_F(CommandInterpreterTests, DestinationCanBeChanged)
    {
        interpreter_.execute("dest /tmp/backup");

        EXPECT_EQ(coordinator_.destinationPath(), "/tmp/backup");
        EXPECT_NE(out_.str().find("Destination: /tmp/backup"), std::string::npos);
    }

    TEST_F(CommandInterpreterTests, CdWithoutSlashEntersTheDirectory)
    {
        std::vector<std::string> listed{};
        ON_CALL(api_, listPath(_, _)).WillByDefault([&listed](std::string const& path, Worker::ApiCallback<Listing> cb) {
            listed.push_back(path);
            cb(Listing{});
        });

        interpreter_.execute("cd DCIM");
        interpreter_.execute("cd ..");

        EXPECT_EQ(listed, (std::vector<std::string>{"/sdcard/DCIM/", "/sdcard/"}));
        EXPECT_EQ(browser_.currentPath(), "/sdcard/");
    }

    TEST_F(CommandInterpreterTests, SelectNeedsAScanResult)
    {
        interpreter_.execute("select 1 2");

        EXPECT_NE(out_.str().find("Run a duplicate scan first"), std::string::npos);
    }

    TEST_F(CommandInterpreterTests, SelectionUsesOneBasedIndices)
    {
        interpreter_.execute("scan");
        ASSERT_TRUE(coordinator_
                        .onChannelEvent(
                            std::string{SharedData::Events::scanComplete},
                            {{"uniques", nlohmann::json::array()},
                             {"duplicates", {{{"files", {"/sdcard/a.jpg", "/sdcard/DCIM/a.jpg"}}}}}})
                        .has_value());

        interpreter_.execute("select 1 1");
        interpreter_.execute("deselect 1 2");

        ASSERT_NE(coordinator_.duplicateScan(), nullptr);
        EXPECT_TRUE(coordinator_.duplicateScan()->isSelected(0, 0));
        EXPECT_FALSE(coordinator_.duplicateScan()->isSelected(0, 1));

        interpreter_.execute("transfer selected");

        ASSERT_EQ(emitted_.size(), 2u);
        EXPECT_EQ(emitted_[1].second["operation"], "copy");
        EXPECT_EQ(emitted_[1].second["paths"], (nlohmann::json{"/sdcard/a.jpg"}));
    }

    TEST_F(CommandInterpreterTests, PreviewOpensTheFetchedFile)
    {
        EXPECT_CALL(api_, previewFile("/sdcard/my notes.txt", _))
            .WillOnce([](std::string const&, Worker::ApiCallback<SharedData::PreviewFile> cb) {
                cb(SharedData::PreviewFile{.localPath = "/tmp/preview/my notes.txt"});
            });
        EXPECT_CALL(opener_, open(std::filesystem::path{"/tmp/preview/my notes.txt"}))
            .WillOnce([](auto const&) -> std::expected<void, Client::ClientError> {
                return {};
            });

        interpreter_.execute(R"(preview "my notes.txt")");
    }

    TEST_F(CommandInterpreterTests, CloudBackupNeedsALogin)
    {
        interpreter_.execute("backup DCIM");

        EXPECT_TRUE(emitted_.empty());
        EXPECT_NE(out_.str().find("Please log in first"), std::string::npos);
    }
}
