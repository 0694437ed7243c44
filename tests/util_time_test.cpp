#include "util_time.hpp"

#include <gtest/gtest.h>

#include <chrono>

using util::parse_scan_time;

TEST(Trim, StripsAsciiWhitespace) {
    EXPECT_EQ(util::trim("  a b \r\n"), "a b");
    EXPECT_EQ(util::trim("\t\t"), "");
    EXPECT_TRUE(util::is_blank(" \t"));
    EXPECT_FALSE(util::is_blank(" x "));
}

TEST(ParseScanTime, EpochIsZero) {
    auto t = parse_scan_time("1/1/1970 0:00");
    ASSERT_TRUE(t);
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*t), 0);
}

TEST(ParseScanTime, AcceptsOneAndTwoDigitFields) {
    auto a = parse_scan_time("1/5/2024 8:00");
    auto b = parse_scan_time("01/05/2024 08:00");
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(*a, *b);
}

TEST(ParseScanTime, OrdersChronologically) {
    auto earlier = parse_scan_time("1/1/2023 10:00");
    auto later = parse_scan_time("1/2/2023 09:00");
    ASSERT_TRUE(earlier);
    ASSERT_TRUE(later);
    EXPECT_LT(*earlier, *later);
}

TEST(ParseScanTime, SecondsAreOptional) {
    auto a = parse_scan_time("3/4/2024 13:45");
    auto b = parse_scan_time("3/4/2024 13:45:00");
    auto c = parse_scan_time("3/4/2024 13:45:30");
    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(*a, *b);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(*c - *a).count(), 30);
}

TEST(ParseScanTime, TwelveHourClock) {
    EXPECT_EQ(parse_scan_time("12/31/2023 11:59 PM"), parse_scan_time("12/31/2023 23:59"));
    EXPECT_EQ(parse_scan_time("12/31/2023 12:00 am"), parse_scan_time("12/31/2023 0:00"));
    EXPECT_EQ(parse_scan_time("12/31/2023 12:30 PM"), parse_scan_time("12/31/2023 12:30"));
    EXPECT_FALSE(parse_scan_time("12/31/2023 13:00 PM"));
}

TEST(ParseScanTime, IsoForms) {
    EXPECT_EQ(parse_scan_time("2023-12-31 23:59:00"), parse_scan_time("12/31/2023 23:59"));
    EXPECT_EQ(parse_scan_time("2023-12-31T23:59Z"), parse_scan_time("12/31/2023 23:59"));
}

TEST(ParseScanTime, IgnoresSurroundingWhitespace) {
    EXPECT_TRUE(parse_scan_time("  1/5/2024 08:00 "));
}

TEST(ParseScanTime, LeapDays) {
    EXPECT_TRUE(parse_scan_time("2/29/2024 00:00"));
    EXPECT_FALSE(parse_scan_time("2/29/2023 00:00"));
    EXPECT_TRUE(parse_scan_time("2/29/2000 00:00"));
    EXPECT_FALSE(parse_scan_time("2/29/1900 00:00"));
}

TEST(ParseScanTime, RejectsMalformedValues) {
    EXPECT_FALSE(parse_scan_time("yesterday"));
    EXPECT_FALSE(parse_scan_time("1/1/2023"));
    EXPECT_FALSE(parse_scan_time("1/1/2023 10:00 extra"));
    EXPECT_FALSE(parse_scan_time("2/30/2023 10:00"));
    EXPECT_FALSE(parse_scan_time("13/1/2023 10:00"));
    EXPECT_FALSE(parse_scan_time("0/1/2023 10:00"));
    EXPECT_FALSE(parse_scan_time("1/1/2023 24:00"));
    EXPECT_FALSE(parse_scan_time("1/1/2023 10:60"));
    EXPECT_FALSE(parse_scan_time("1/1/23 10:00"));
    EXPECT_FALSE(parse_scan_time(""));
}
