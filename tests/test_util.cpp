#include "util.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace std::chrono;

TEST(UtilTest, TrimAndUpper) {
    EXPECT_EQ(util::trim("  eur/usd \n"), "eur/usd");
    EXPECT_EQ(util::trim("   "), "");
    EXPECT_EQ(util::to_upper("m15"), "M15");
}

TEST(UtilTest, Iso8601RoundTripKeepsMilliseconds) {
    const auto tp = util::parse_iso8601("2024-03-04T10:15:30.250Z");
    EXPECT_EQ(util::format_iso8601(tp), "2024-03-04T10:15:30.250Z");
    EXPECT_EQ(util::utc_hour(tp), 10);
}

TEST(UtilTest, Iso8601AcceptsFeedAndOffsetForms) {
    const auto reference = util::parse_iso8601("2024-03-04T10:00:00Z");
    EXPECT_EQ(util::parse_iso8601("2024-03-04 10:00:00"), reference);
    EXPECT_EQ(util::parse_iso8601("2024-03-04T12:00:00+02:00"), reference);
    EXPECT_EQ(util::parse_iso8601("2024-03-04"), reference - hours(10));
    EXPECT_THROW(util::parse_iso8601("yesterday"), std::runtime_error);
}

TEST(UtilTest, TimeframeDurations) {
    EXPECT_EQ(util::timeframe_duration("M15"), minutes(15));
    EXPECT_EQ(util::timeframe_duration("H4"), hours(4));
    EXPECT_EQ(util::timeframe_duration("D1"), hours(24));
    EXPECT_EQ(util::timeframe_duration("15min"), minutes(15));
    EXPECT_EQ(util::timeframe_duration("1h"), hours(1));
    EXPECT_EQ(util::timeframe_duration("1day"), hours(24));
    EXPECT_EQ(util::timeframe_duration("30min"), minutes(30));
    EXPECT_EQ(util::timeframe_duration("1week"), hours(24 * 7));
    EXPECT_EQ(util::timeframe_duration(" 15MIN "), minutes(15));
    EXPECT_THROW(util::timeframe_duration("M"), std::invalid_argument);
    EXPECT_THROW(util::timeframe_duration("X15"), std::invalid_argument);
    EXPECT_THROW(util::timeframe_duration("fortnight"), std::invalid_argument);
    EXPECT_THROW(util::timeframe_duration(""), std::invalid_argument);
}

TEST(UtilTest, BarsBetweenCountsWholeBars) {
    const auto from = util::parse_iso8601("2024-03-04T10:00:00Z");
    EXPECT_EQ(util::bars_between("M15", from, from + minutes(95)), 6);
    EXPECT_EQ(util::bars_between("H1", from, from + minutes(59)), 0);
    EXPECT_EQ(util::bars_between("M15", from, from - minutes(30)), 0);
}

TEST(UtilTest, HashingIsStable) {
    const std::string text = "EUR/USD";
    EXPECT_EQ(util::fnv1a(text.data(), text.size()), util::fnv1a(text.data(), text.size()));
    EXPECT_NE(util::fnv1a("a", 1), util::fnv1a("b", 1));
    EXPECT_EQ(util::hex_digest(0xabcdefULL, 8), "00abcdef");
    EXPECT_EQ(util::hex_digest(0x123456789abcdef0ULL, 4), "def0");
}

TEST(UtilTest, MathHelpers) {
    EXPECT_DOUBLE_EQ(util::clamp01(-0.2), 0.0);
    EXPECT_DOUBLE_EQ(util::clamp01(1.7), 1.0);
    EXPECT_DOUBLE_EQ(util::clamp01(0.42), 0.42);
    EXPECT_DOUBLE_EQ(util::round_to(0.123456, 4), 0.1235);

    for (int i = 0; i < 100; ++i) {
        const double value = util::random_jitter(10.0, 0.1);
        EXPECT_GE(value, 9.0);
        EXPECT_LE(value, 11.0);
    }
}
