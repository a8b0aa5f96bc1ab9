#pragma once

#include <frontend/console_control_surface.hpp>
#include <client/duplicate_scan_session.hpp>

#include <gtest/gtest.h>

#include <sstream>

namespace Test
{
    class ConsoleControlSurfaceTests : public ::testing::Test
    {
      protected:
        std::ostringstream out_{};
        ConsoleControlSurface surface_{out_};
    };

    TEST_F(ConsoleControlSurfaceTests, StartsWithTheIdleGating)
    {
        EXPECT_TRUE(surface_.operationControlsEnabled());
        EXPECT_FALSE(surface_.cancelEnabled());
        EXPECT_FALSE(surface_.cloudControlsEnabled());
    }

    TEST_F(ConsoleControlSurfaceTests, ProgressIsPrintedOncePerPercent)
    {
        surface_.showProgress(1, 1000);
        surface_.showProgress(2, 1000);
        surface_.showProgress(10, 1000);

        EXPECT_EQ(out_.str(), "Progress: 1/1000 (0%)\nProgress: 10/1000 (1%)\n");
    }

    TEST_F(ConsoleControlSurfaceTests, ResetProgressPrintsAgain)
    {
        surface_.showProgress(5, 10);
        surface_.showProgress(0, 0);
        surface_.showProgress(5, 10);

        EXPECT_EQ(out_.str(), "Progress: 5/10 (50%)\nProgress: 5/10 (50%)\n");
    }

    TEST_F(ConsoleControlSurfaceTests, ConflictPromptIsOneBased)
    {
        surface_.promptConflict("/sdcard/a.jpg", 0, 2);

        EXPECT_TRUE(surface_.conflictPromptOpen());
        EXPECT_NE(out_.str().find("Conflict 1/2: '/sdcard/a.jpg'"), std::string::npos);

        surface_.closeConflictPrompt();
        EXPECT_FALSE(surface_.conflictPromptOpen());
    }

    TEST_F(ConsoleControlSurfaceTests, DuplicateGroupsShowTheSelection)
    {
        const Client::DuplicateScanSession session{SharedData::DuplicateScanResult{
            .uniqueFiles = {"/sdcard/u.jpg"},
            .duplicateGroups = {{.hash = std::nullopt, .files = {"/sdcard/a.jpg", "/sdcard/DCIM/a.jpg"}}},
        }};

        surface_.showDuplicateScanResult(session);

        const auto text = out_.str();
        EXPECT_NE(text.find("[ ] 1.1 /sdcard/a.jpg"), std::string::npos);
        EXPECT_NE(text.find("[x] 1.2 /sdcard/DCIM/a.jpg"), std::string::npos);
        EXPECT_NE(text.find("1 of 2 duplicates selected"), std::string::npos);
    }

    TEST_F(ConsoleControlSurfaceTests, RefreshRequestsReachTheHandler)
    {
        int refreshes = 0;
        surface_.onListingRefreshRequested([&refreshes]() {
            ++refreshes;
        });

        surface_.requestListingRefresh();

        EXPECT_EQ(refreshes, 1);
    }
}
