// SPDX-License-Identifier: MIT
// Unit tests for the logger

#include "TestUtils.h"
#include <ViewportStreaming/Logging.h>
#include <ViewportStreaming/Types.h>

#include <cstring>

namespace vp_stream {
namespace test {

TEST(LoggingTest, MessagesAboveLevelAreDropped) {
    LogCapture capture(LogLevel::Warn);

    logMessage(LogLevel::Error, "error %d", 1);
    logMessage(LogLevel::Warn, "warn %s", "two");
    logMessage(LogLevel::Info, "info");
    logMessage(LogLevel::Debug, "debug");

    auto lines = capture.lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].first, LogLevel::Error);
    EXPECT_EQ(lines[0].second, "error 1");
    EXPECT_EQ(lines[1].second, "warn two");
}

TEST(LoggingTest, OffSilencesEverything) {
    LogCapture capture(LogLevel::Off);
    logMessage(LogLevel::Error, "nothing");
    EXPECT_TRUE(capture.lines().empty());
}

TEST(LoggingTest, TrailingNewlineIsStripped) {
    LogCapture capture(LogLevel::Info);
    logMessage(LogLevel::Info, "line\n");
    auto lines = capture.lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].second, "line");
}

TEST(LoggingTest, LevelNames) {
    EXPECT_STREQ(logLevelName(LogLevel::Off), "off");
    EXPECT_STREQ(logLevelName(LogLevel::Warn), "warn");
    EXPECT_STREQ(logLevelName(LogLevel::Debug), "debug");
}

TEST(LoggingTest, ErrorStrings) {
    EXPECT_STRNE(getErrorString(LoadingError::Success), "");
    EXPECT_STRNE(getErrorString(LoadingError::PoolExhausted), getErrorString(LoadingError::AdmissionDenied));
    EXPECT_STREQ(contentTypeName(ContentType::Volume), "volume");
}

}  // namespace test
}  // namespace vp_stream
