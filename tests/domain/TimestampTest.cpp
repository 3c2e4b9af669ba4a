#include <gtest/gtest.h>

#include "domain/Timestamp.hpp"

using ledger::domain::Timestamp;

TEST(TimestampTest, Parse_DateOnly_Midnight) {
    auto ts = Timestamp::parse("2025-12-16");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->toString(), "2025-12-16T00:00:00Z");
}

TEST(TimestampTest, Parse_Microseconds_RoundTripsText) {
    auto ts = Timestamp::parse("2025-12-16T10:30:00.250000Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->toString(), "2025-12-16T10:30:00.250000Z");
    EXPECT_EQ(ts->toUnixMicros() % 1000000, 250000);
}

TEST(TimestampTest, Parse_SpaceSeparator_Accepted) {
    auto ts = Timestamp::parse("2025-12-16 10:30:00");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->toString(), "2025-12-16T10:30:00Z");
}

TEST(TimestampTest, Parse_Garbage_ReturnsNullopt) {
    EXPECT_FALSE(Timestamp::parse("yesterday").has_value());
    EXPECT_FALSE(Timestamp::parse("2025-12-16T10:30:00+03:00").has_value());
    EXPECT_FALSE(Timestamp::parse("2025-12-16T10:30:00.").has_value());
}

TEST(TimestampTest, Ordering_And_Arithmetic) {
    auto base = Timestamp::fromUnixSeconds(1700000000);
    EXPECT_LT(base, base.addSeconds(1));
    EXPECT_EQ(base.addHours(1), base.addMinutes(60));
    EXPECT_EQ(base.addHours(-2).toUnixSeconds(), 1700000000 - 7200);
}

TEST(TimestampTest, Now_TruncatedToMicroseconds) {
    auto now = Timestamp::now();
    EXPECT_EQ(Timestamp::fromUnixMicros(now.toUnixMicros()), now);
}
