#include <gtest/gtest.h>
#include "utils.hpp"

#include <chrono>
#include <stdexcept>

using namespace core;
using namespace core::utils;

// --- Timestamp parsing ---

TEST(Utils_StringToTimestamp, DateOnly_IsMidnightUtc) {
    Timestamp ts = stringToTimestamp("2024-01-31");
    EXPECT_EQ(timestampToString(ts), "2024-01-31T00:00:00Z");
}

TEST(Utils_StringToTimestamp, DateTimeWithoutZone_IsUtc) {
    EXPECT_EQ(timestampToString(stringToTimestamp("2024-03-05T14:30:15")), "2024-03-05T14:30:15Z");
    EXPECT_EQ(timestampToString(stringToTimestamp("2024-03-05 14:30:15")), "2024-03-05T14:30:15Z");
}

TEST(Utils_StringToTimestamp, OffsetIsNormalisedToUtc) {
    Timestamp ts = stringToTimestamp("2015-04-20T00:00:00+05:30");
    EXPECT_EQ(timestampToString(ts), "2015-04-19T18:30:00Z");

    Timestamp west = stringToTimestamp("2015-04-20T22:00:00-03:00");
    EXPECT_EQ(timestampToString(west), "2015-04-21T01:00:00Z");
}

TEST(Utils_StringToTimestamp, FractionalSecondsKept) {
    Timestamp whole = stringToTimestamp("2024-01-01T00:00:00Z");
    Timestamp frac = stringToTimestamp("2024-01-01T00:00:00.250Z");
    auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(frac - whole);
    EXPECT_EQ(diff.count(), 250);
}

TEST(Utils_StringToTimestamp, Garbage_Throws) {
    EXPECT_THROW(stringToTimestamp("not-a-date"), std::runtime_error);
    EXPECT_THROW(stringToTimestamp("2024-01-01T12:00:00X"), std::runtime_error);
    EXPECT_THROW(stringToTimestamp("2024-01-01 extra"), std::runtime_error);
    EXPECT_THROW(stringToTimestamp(""), std::runtime_error);
}

// --- Formatting ---

TEST(Utils_Format, IsoAndMonthStrings) {
    Timestamp ts = stringToTimestamp("2023-12-31T23:59:59Z");
    EXPECT_EQ(timestampToString(ts), "2023-12-31T23:59:59Z");
    EXPECT_EQ(timestampToYearMonth(ts), "2023-12");
}

// --- Day arithmetic ---

TEST(Utils_DaysBetween, WholeDaysFloored) {
    Timestamp a = stringToTimestamp("2024-01-01");
    EXPECT_EQ(daysBetween(a, stringToTimestamp("2024-01-01")), 0);
    EXPECT_EQ(daysBetween(a, stringToTimestamp("2024-01-01T23:00:00Z")), 0);
    EXPECT_EQ(daysBetween(a, stringToTimestamp("2024-01-04")), 3);
    EXPECT_EQ(daysBetween(a, stringToTimestamp("2025-01-01")), 366); // Leap year
}

// --- Rounding ---

TEST(Utils_RoundTo, HalfAwayFromZero) {
    EXPECT_DOUBLE_EQ(roundTo(2.5, 0), 3.0);
    EXPECT_DOUBLE_EQ(roundTo(-2.5, 0), -3.0);
    EXPECT_DOUBLE_EQ(roundTo(10.126, 2), 10.13);
    EXPECT_DOUBLE_EQ(roundTo(10.124, 2), 10.12);
}

TEST(Utils_RoundTo, ZeroDecimalsAndIdentity) {
    EXPECT_DOUBLE_EQ(roundTo(99.4, 0), 99.0);
    EXPECT_DOUBLE_EQ(roundTo(8000.0, 2), 8000.0);
}
