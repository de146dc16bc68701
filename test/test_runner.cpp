// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for the unit suites under test/unit/.

#include <gtest/gtest.h>
#include "util/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    sensiscan::util::logger::setLogLevel(sensiscan::util::logger::LogLevel::WARN);
    return RUN_ALL_TESTS();
}
