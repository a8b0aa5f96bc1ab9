#include "test_conflict_resolution_session.hpp"
#include "test_duplicate_scan_session.hpp"
#include "test_operation_coordinator.hpp"
#include "test_remote_browser.hpp"
#include "test_account_session.hpp"
#include "test_preview_service.hpp"

#include <log/log.hpp>

#include <gtest/gtest.h>

#include <filesystem>

std::filesystem::path programDirectory;

int main(int argc, char** argv)
{
    Log::setLevel(Log::Level::Off);

    programDirectory = std::filesystem::path{argv[0]}.parent_path();

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
