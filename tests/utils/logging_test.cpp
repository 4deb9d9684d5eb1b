/**
 * @file    logging_test.cpp
 * @brief   Unit tests for the logging setup and in-memory log buffer
 * @license MIT
 */

#include <gtest/gtest.h>
#include "utils/logging.hpp"

namespace bba::logging {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Options options;
        options.console_level = spdlog::level::off;
        options.file_sink = false;
        options.ring_buffer_size = 3;
        init(options);
    }
};

TEST_F(LoggingTest, RingKeepsMostRecentEntries) {
    for (int i = 0; i < 5; ++i) {
        spdlog::info("[LoggingTest] message {}", i);
    }

    const auto entries = recent_entries();

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_NE(entries.front().text.find("message 2"), std::string::npos);
    EXPECT_NE(entries.back().text.find("message 4"), std::string::npos);
    EXPECT_EQ(entries.back().level, spdlog::level::info);
}

TEST_F(LoggingTest, EntriesHaveNoTrailingNewline) {
    spdlog::warn("[LoggingTest] careful");

    const auto entries = recent_entries();

    ASSERT_FALSE(entries.empty());
    EXPECT_NE(entries.back().text.back(), '\n');
    EXPECT_NE(entries.back().text.find("[warning]"), std::string::npos);
    EXPECT_EQ(entries.back().level, spdlog::level::warn);
}

TEST_F(LoggingTest, DebugMessagesAreCaptured) {
    spdlog::debug("[LoggingTest] detail");

    const auto entries = recent_entries();

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, spdlog::level::debug);
}

TEST_F(LoggingTest, ClearRecentEmptiesBuffer) {
    spdlog::info("[LoggingTest] one");
    clear_recent();

    EXPECT_TRUE(recent_entries().empty());

    spdlog::info("[LoggingTest] two");
    ASSERT_EQ(recent_entries().size(), 1u);
}

TEST(LoggingNoRingTest, NoRingBufferMeansNoEntries) {
    Options options;
    options.console_level = spdlog::level::off;
    options.file_sink = false;
    init(options);

    spdlog::info("[LoggingTest] unseen");

    EXPECT_TRUE(recent_entries().empty());
}

TEST(LoggingNoRingTest, LogDirectoryUnderAppData) {
    EXPECT_EQ(default_log_dir().filename(), "logs");
}

}  // namespace bba::logging
