#include "test_command_interpreter.hpp"
#include "test_console_control_surface.hpp"

#include <log/log.hpp>

#include <gtest/gtest.h>

int main(int argc, char** argv)
{
    Log::setLevel(Log::Level::Off);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
