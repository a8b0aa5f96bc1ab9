#pragma once

#include <persistence/paths.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>
#include <string>

namespace Persistence::Test
{
    class PathsTests : public ::testing::Test
    {
      public:
        void SetUp() override
        {
            remember("HOME", home_);
            remember("XDG_CONFIG_HOME", configHome_);
            setenv("HOME", "/home/tester", 1);
            unsetenv("XDG_CONFIG_HOME");
        }

        void TearDown() override
        {
            restore("HOME", home_);
            restore("XDG_CONFIG_HOME", configHome_);
        }

      private:
        static void remember(char const* name, std::optional<std::string>& slot)
        {
            if (const char* value = std::getenv(name); value != nullptr)
                slot = value;
        }
        static void restore(char const* name, std::optional<std::string> const& slot)
        {
            if (slot)
                setenv(name, slot->c_str(), 1);
            else
                unsetenv(name);
        }

        std::optional<std::string> home_{};
        std::optional<std::string> configHome_{};
    };

    TEST_F(PathsTests, TildeIsExpanded)
    {
        EXPECT_EQ(resolvePath("~/PhoneBackup"), std::filesystem::path{"/home/tester/PhoneBackup"});
        EXPECT_EQ(resolvePath("~"), std::filesystem::path{"/home/tester"});
    }

    TEST_F(PathsTests, OtherPathsAreUntouched)
    {
        EXPECT_EQ(resolvePath("/tmp/out"), std::filesystem::path{"/tmp/out"});
        EXPECT_EQ(resolvePath("relative/dir"), std::filesystem::path{"relative/dir"});
        EXPECT_EQ(resolvePath("~other/dir"), std::filesystem::path{"~other/dir"});
    }

    TEST_F(PathsTests, DefaultConfigPathUsesDotConfig)
    {
        EXPECT_EQ(defaultConfigPath(), std::filesystem::path{"/home/tester/.config/courier/config.json"});
    }

    TEST_F(PathsTests, DefaultConfigPathHonorsXdgConfigHome)
    {
        setenv("XDG_CONFIG_HOME", "/etc/xdg-test", 1);
        EXPECT_EQ(defaultConfigPath(), std::filesystem::path{"/etc/xdg-test/courier/config.json"});
    }
}
