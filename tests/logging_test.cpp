#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
#include "holdem/logging.hpp"

using namespace holdem;

// =============================================================================
// Structured Logging Tests
// =============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_level_ = log_level();
        set_log_stream(&out_);
    }

    void TearDown() override {
        set_log_stream(nullptr);
        set_log_level(previous_level_);
    }

    std::ostringstream out_;
    LogLevel previous_level_ = LogLevel::Info;
};

TEST_F(LoggingTest, LogEvent_ShouldWriteOneJsonObjectPerLine) {
    // Given the threshold at info
    set_log_level(LogLevel::Info);

    // When an event with fields is logged
    log_info("betting", "betting_round_started", {{"players", 3}, {"street", "preflop"}});

    // Then a single JSON line should carry the standard and custom fields
    std::string line = out_.str();
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');

    auto entry = nlohmann::json::parse(line);
    EXPECT_EQ(entry["level"], "info");
    EXPECT_EQ(entry["message"], "betting_round_started");
    EXPECT_EQ(entry["domain"], "betting");
    EXPECT_EQ(entry["players"], 3);
    EXPECT_EQ(entry["street"], "preflop");
    EXPECT_TRUE(entry.contains("timestamp"));
}

TEST_F(LoggingTest, BelowThreshold_ShouldBeDropped) {
    set_log_level(LogLevel::Warn);

    log_debug("betting", "action_applied");
    log_info("betting", "betting_round_completed");

    EXPECT_TRUE(out_.str().empty());

    log_warn("betting", "action_rejected");
    EXPECT_FALSE(out_.str().empty());
}

TEST_F(LoggingTest, Off_ShouldSilenceEverything) {
    set_log_level(LogLevel::Off);

    log_error("betting", "chip_arithmetic_overflow");

    EXPECT_TRUE(out_.str().empty());
}

TEST_F(LoggingTest, ParseLogLevel_ShouldAcceptLowercaseNames) {
    EXPECT_EQ(parse_log_level("debug").value(), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warn").value(), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("off").value(), LogLevel::Off);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST_F(LoggingTest, Timestamp_ShouldBeIso8601Utc) {
    std::string ts = now_iso8601();

    ASSERT_EQ(ts.size(), 20u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts.back(), 'Z');
}
