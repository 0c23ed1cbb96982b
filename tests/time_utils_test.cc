#include <gtest/gtest.h>

#include "../src/time_utils.h"

using namespace playledger::time_utils;

TEST(TimeUtilsTest, ParsesIsoWithZulu) {
    EXPECT_EQ(parse_timestamp_us("2024-01-01T00:00:00Z"), 1704067200LL * kMicrosPerSecond);
}

TEST(TimeUtilsTest, ParsesFractionAndOffset) {
    EXPECT_EQ(parse_timestamp_us("2024-01-01T02:00:00.250+02:00"),
              1704067200LL * kMicrosPerSecond + 250000);
    EXPECT_EQ(parse_timestamp_us("2024-01-01T00:00:00+00:00Z"), 1704067200LL * kMicrosPerSecond);
    EXPECT_EQ(parse_timestamp_us("2023-12-31T19:00:00-05:00"), 1704067200LL * kMicrosPerSecond);
}

TEST(TimeUtilsTest, ParsesSqlDatetimeAsUtc) {
    EXPECT_EQ(parse_timestamp_us("2024-01-01 00:00:01"), 1704067201LL * kMicrosPerSecond);
}

TEST(TimeUtilsTest, DigitsAreEpochMillis) {
    EXPECT_EQ(parse_timestamp_us("1704067200000"), 1704067200LL * kMicrosPerSecond);
    EXPECT_FALSE(parse_timestamp_us("1234567890123456789012").has_value());
}

TEST(TimeUtilsTest, RejectsGarbage) {
    EXPECT_FALSE(parse_timestamp_us("").has_value());
    EXPECT_FALSE(parse_timestamp_us("yesterday").has_value());
    EXPECT_FALSE(parse_timestamp_us("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parse_timestamp_us("2024-01-01T00:00:00.Z").has_value());
    EXPECT_FALSE(parse_timestamp_us("2024-01-01T00:00:00 trailing").has_value());
}

TEST(TimeUtilsTest, FormatsRfc3339) {
    EXPECT_EQ(to_rfc3339_utc(1704067200LL * kMicrosPerSecond), "2024-01-01T00:00:00Z");
    EXPECT_EQ(to_rfc3339_utc(1704067200LL * kMicrosPerSecond + 5), "2024-01-01T00:00:00.000005Z");
    EXPECT_EQ(to_rfc3339_utc(-1), "1969-12-31T23:59:59.999999Z");
}
