/**
 * @file test_logging.cpp
 * @brief Unit tests for callback-based logging.
 */

#include <gtest/gtest.h>
#include <chip8/logging.h>
#include "support/log_capture.h"

#include <string>

using namespace chip8;
using chip8::test::LogCapture;

// ─────────────────────────────────────────────────────────────────────────────
// Level Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST(LoggingTest, LevelNames) {
    EXPECT_STREQ(log_level_name(LogLevel::Error), "ERROR");
    EXPECT_STREQ(log_level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(log_level_name(LogLevel::Info), "INFO");
    EXPECT_STREQ(log_level_name(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(log_level_name(LogLevel::Trace), "TRACE");
}

TEST(LoggingTest, SetAndGetLevel) {
    const LogLevel saved = get_log_level();
    set_log_level(LogLevel::Debug);
    EXPECT_EQ(get_log_level(), LogLevel::Debug);
    EXPECT_TRUE(CHIP8_LOG_LEVEL_ENABLED(Debug));
    EXPECT_FALSE(CHIP8_LOG_LEVEL_ENABLED(Trace));
    set_log_level(saved);
}

// ─────────────────────────────────────────────────────────────────────────────
// Callback Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST(LoggingTest, CallbackReceivesFormattedMessage) {
    LogCapture capture;
    CHIP8_LOG_WARN("CPU", "Unknown instruction 0x%04X at 0x%03X; skipping", 0xE1FFu, 0x204u);

    ASSERT_EQ(capture.records().size(), 1u);
    const auto& record = capture.records()[0];
    EXPECT_EQ(record.level, LogLevel::Warn);
    EXPECT_EQ(record.subsystem, "CPU");
    EXPECT_EQ(record.message, "Unknown instruction 0xE1FF at 0x204; skipping");
}

TEST(LoggingTest, MessagesBelowLevelAreDropped) {
    LogCapture capture(LogLevel::Warn);
    CHIP8_LOG_INFO("VM", "dropped");
    CHIP8_LOG_DEBUG("VM", "dropped");
    CHIP8_LOG_TRACE("VM", "dropped");
    CHIP8_LOG_ERROR("VM", "kept");
    ASSERT_EQ(capture.records().size(), 1u);
    EXPECT_EQ(capture.records()[0].message, "kept");
}

TEST(LoggingTest, TraceSkipsArgumentEvaluationWhenDisabled) {
    LogCapture capture(LogLevel::Info);
    int evaluated = 0;
    CHIP8_LOG_TRACE("CPU", "%d", ++evaluated);
    EXPECT_EQ(evaluated, 0);
}

TEST(LoggingTest, LogRawHandlesUnterminatedView) {
    LogCapture capture;
    const char text[] = "MEMORY";
    log_raw(LogLevel::Info, "MEM", std::string_view(text, 3));
    ASSERT_EQ(capture.records().size(), 1u);
    EXPECT_EQ(capture.records()[0].message, "MEM");
}

TEST(LoggingTest, LongMessagesTruncatedWithEllipsis) {
    LogCapture capture;
    const std::string big(4000, 'x');
    CHIP8_LOG_INFO("ROM", "%s", big.c_str());
    ASSERT_EQ(capture.records().size(), 1u);
    const std::string& msg = capture.records()[0].message;
    EXPECT_LT(msg.size(), big.size());
    EXPECT_EQ(msg.substr(msg.size() - 3), "...");
}

TEST(LoggingTest, NullCallbackRestoresDefaultHandler) {
    {
        LogCapture capture;
    }
    // Back on the stderr handler; must not crash
    CHIP8_LOG_ERROR("VM", "to stderr");
    SUCCEED();
}
