/**
 * @file test_bridge_builder.cpp
 * @brief Unit tests for BridgeConfig and BridgeBuilder.
 */

#include <gtest/gtest.h>
#include <droidglue/config.h>

using namespace droidglue;
using namespace std::chrono_literals;

TEST(BridgeConfigTest, Defaults) {
    BridgeConfig config;
    EXPECT_EQ(config.window_poll_interval, 10ms);
    EXPECT_TRUE(config.redirect_stdio);
    EXPECT_EQ(config.log_level, LogLevel::Info);
}

TEST(BridgeBuilderTest, DefaultBuildSucceeds) {
    auto config = BridgeBuilder().build();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->window_poll_interval, 10ms);
}

TEST(BridgeBuilderTest, FluentSetters) {
    auto config = BridgeBuilder()
        .with_window_poll_interval(5ms)
        .with_stdio_redirect(false)
        .with_log_level(LogLevel::Debug)
        .build();

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->window_poll_interval, 5ms);
    EXPECT_FALSE(config->redirect_stdio);
    EXPECT_EQ(config->log_level, LogLevel::Debug);
}

TEST(BridgeBuilderTest, VerboseSetsTrace) {
    auto config = BridgeBuilder().verbose().build();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->log_level, LogLevel::Trace);
}

TEST(BridgeBuilderTest, IntervalBoundsInclusive) {
    EXPECT_TRUE(BridgeBuilder().with_window_poll_interval(1ms).build().has_value());
    EXPECT_TRUE(BridgeBuilder().with_window_poll_interval(1000ms).build().has_value());
}

TEST(BridgeBuilderTest, ZeroIntervalRejected) {
    auto config = BridgeBuilder().with_window_poll_interval(0ms).build();
    ASSERT_FALSE(config.has_value());
    EXPECT_TRUE(config.error().is(ErrorCode::InvalidArgument));
}

TEST(BridgeBuilderTest, OversizedIntervalRejected) {
    auto config = BridgeBuilder().with_window_poll_interval(1001ms).build();
    ASSERT_FALSE(config.has_value());
    EXPECT_TRUE(config.error().is(ErrorCode::InvalidArgument));
    EXPECT_NE(config.error().message().find("1001"), std::string::npos);
}

TEST(BridgeBuilderTest, OutOfRangeLogLevelRejected) {
    auto config = BridgeBuilder().with_log_level(static_cast<LogLevel>(42)).build();
    ASSERT_FALSE(config.has_value());
    EXPECT_TRUE(config.error().is(ErrorCode::InvalidArgument));
}
