#pragma once

#include <utility/algorithm/case_convert.hpp>
#include <utility/algorithm/trim.hpp>

#include <gtest/gtest.h>

namespace Utility::Test
{
    class AlgorithmTests : public ::testing::Test
    {};

    TEST_F(AlgorithmTests, TrimRemovesSurroundingWhitespace)
    {
        EXPECT_EQ(Algorithm::trim("  copy a.jpg\r\n"), "copy a.jpg");
        EXPECT_EQ(Algorithm::trim("\t\t"), "");
        EXPECT_EQ(Algorithm::trim("ls"), "ls");
    }

    TEST_F(AlgorithmTests, LowerCaseLeavesNonLettersAlone)
    {
        EXPECT_EQ(Algorithm::toLowerCase("Overwrite-ALL 2"), "overwrite-all 2");
    }

    TEST_F(AlgorithmTests, CaseInsensitiveComparison)
    {
        EXPECT_TRUE(Algorithm::equalsIgnoreCase("WARNING", "warning"));
        EXPECT_FALSE(Algorithm::equalsIgnoreCase("warn", "warning"));
    }
}
