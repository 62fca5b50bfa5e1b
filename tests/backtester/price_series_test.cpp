#include <gtest/gtest.h>
#include "price_series.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <limits>

using namespace backtester;
using namespace backtester::test_support;

TEST(PriceSeries_Construct, ValidSeriesExposesBars) {
    PriceSeries series = makeSeries({10.0, 11.0, 12.0}, {1, 0, -1});
    ASSERT_EQ(series.size(), 3u);
    EXPECT_DOUBLE_EQ(series.bar(1).close, 11.0);
    EXPECT_EQ(series.signal(2), -1);
    EXPECT_EQ(series.firstTimestamp(), dayAt(0));
    EXPECT_EQ(series.lastTimestamp(), dayAt(2));
    EXPECT_FALSE(series.sizeHint(0).has_value());
}

TEST(PriceSeries_Construct, EmptyThrows) {
    EXPECT_THROW(PriceSeries({}, {}), core::InvalidSeriesException);
}

TEST(PriceSeries_Construct, SignalLengthMismatchThrows) {
    EXPECT_THROW(PriceSeries(dailyBars({10.0, 11.0}), {1}), core::InvalidSeriesException);
}

TEST(PriceSeries_Construct, NonIncreasingTimestampsThrow) {
    auto bars = dailyBars({10.0, 11.0, 12.0});
    bars[2].timestamp = bars[1].timestamp; // Duplicate
    EXPECT_THROW(PriceSeries(bars, {0, 0, 0}), core::InvalidSeriesException);

    auto reversed = dailyBars({10.0, 11.0});
    std::swap(reversed[0].timestamp, reversed[1].timestamp);
    EXPECT_THROW(PriceSeries(reversed, {0, 0}), core::InvalidSeriesException);
}

TEST(PriceSeries_Construct, BadPricesThrow) {
    EXPECT_THROW(makeSeries({10.0, 0.0}, {0, 0}), core::InvalidSeriesException);
    EXPECT_THROW(makeSeries({-5.0}, {0}), core::InvalidSeriesException);
    EXPECT_THROW(makeSeries({std::numeric_limits<double>::quiet_NaN()}, {0}), core::InvalidSeriesException);

    auto bars = dailyBars({10.0});
    bars[0].low = 0.0;
    EXPECT_THROW(PriceSeries(bars, {0}), core::InvalidSeriesException);
}

TEST(PriceSeries_Construct, NegativeVolumeThrows) {
    auto bars = dailyBars({10.0});
    bars[0].volume = -1;
    EXPECT_THROW(PriceSeries(bars, {0}), core::InvalidSeriesException);
}

TEST(PriceSeries_Construct, MalformedSignalsAreAccepted) {
    // Out-of-range signals are a simulation concern, not a structural one
    EXPECT_NO_THROW(makeSeries({10.0, 11.0}, {2, -3}));
}

TEST(PriceSeries_SizeHints, ValidatedAndExposed) {
    PriceSeries series(dailyBars({10.0, 11.0}), {1, 0}, {0.5, std::nullopt});
    ASSERT_TRUE(series.sizeHint(0).has_value());
    EXPECT_DOUBLE_EQ(*series.sizeHint(0), 0.5);
    EXPECT_FALSE(series.sizeHint(1).has_value());

    EXPECT_THROW(PriceSeries(dailyBars({10.0}), {1}, {1.5}), core::InvalidSeriesException);
    EXPECT_THROW(PriceSeries(dailyBars({10.0}), {1}, {0.0}), core::InvalidSeriesException);
    EXPECT_THROW(PriceSeries(dailyBars({10.0, 11.0}), {1, 0}, {0.5}), core::InvalidSeriesException);
}

TEST(PriceSeries_Slice, InclusiveBounds) {
    PriceSeries series = makeSeries({10.0, 11.0, 12.0, 13.0, 14.0}, {1, 0, 0, 0, -1});
    PriceSeries middle = series.slice(dayAt(1), dayAt(3));
    ASSERT_EQ(middle.size(), 3u);
    EXPECT_DOUBLE_EQ(middle.bar(0).close, 11.0);
    EXPECT_DOUBLE_EQ(middle.bar(2).close, 13.0);
    EXPECT_EQ(middle.signal(0), 0);

    PriceSeries tail = series.slice(dayAt(3), std::nullopt);
    EXPECT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail.signal(1), -1);
}

TEST(PriceSeries_Slice, EmptyRangeThrows) {
    PriceSeries series = makeSeries({10.0, 11.0}, {0, 0});
    EXPECT_THROW(series.slice(dayAt(10), std::nullopt), core::InvalidSeriesException);
}
