/**
 * Unit tests for TimeUtils
 */

#include "utils/Time.h"

#include <gtest/gtest.h>

TEST(TimeUtilsTest, ParsesZuluWithFraction) {
    auto tp = TimeUtils::parseISO8601("2024-12-22T15:30:45.123Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(TimeUtils::formatISO8601(*tp), "2024-12-22T15:30:45.123000+00:00");
    EXPECT_EQ(TimeUtils::formatClock(*tp), "15:30");
}

TEST(TimeUtilsTest, ParsesExplicitOffset) {
    auto tp = TimeUtils::parseISO8601("2026-03-02T09:14:03+00:00");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(TimeUtils::formatISO8601(*tp), "2026-03-02T09:14:03+00:00");
}

TEST(TimeUtilsTest, EpochSeconds) {
    auto tp = TimeUtils::parseISO8601("1970-01-01T00:01:40Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(tp->time_since_epoch()).count(), 100);
}

TEST(TimeUtilsTest, RejectsMalformedInput) {
    EXPECT_FALSE(TimeUtils::parseISO8601("").has_value());
    EXPECT_FALSE(TimeUtils::parseISO8601("yesterday").has_value());
}
