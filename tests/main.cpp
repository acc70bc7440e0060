// SPDX-License-Identifier: MIT
// Main entry point for unit tests

#include <gtest/gtest.h>
#include <ViewportStreaming/Logging.h>

#include <cstdlib>
#include <iostream>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Keep test output quiet unless a level was requested explicitly
    if (!std::getenv("VP_STREAM_LOG_LEVEL")) {
        vp_stream::setLogLevel(vp_stream::LogLevel::Off);
    } else {
        std::cout << "Log level: " << vp_stream::logLevelName(vp_stream::getLogLevel()) << std::endl;
    }

    return RUN_ALL_TESTS();
}
