#include <gtest/gtest.h>
#include "datatypes.hpp"

using namespace core;

TEST(Datatypes_SignalFromInt, KnownValues) {
    EXPECT_EQ(signalFromInt(1), SignalAction::EnterLong);
    EXPECT_EQ(signalFromInt(-1), SignalAction::ExitLong);
    EXPECT_EQ(signalFromInt(0), SignalAction::None);
}

TEST(Datatypes_SignalFromInt, MalformedValuesActAsNone) {
    EXPECT_EQ(signalFromInt(2), SignalAction::None);
    EXPECT_EQ(signalFromInt(-7), SignalAction::None);
}

TEST(Datatypes_TradeSide, ToString) {
    EXPECT_EQ(toString(TradeSide::Buy), "BUY");
    EXPECT_EQ(toString(TradeSide::Sell), "SELL");
}

TEST(Datatypes_Trade, SellOnlyFieldsEmptyByDefault) {
    Trade trade;
    EXPECT_FALSE(trade.profit.has_value());
    EXPECT_FALSE(trade.profit_percent.has_value());
    EXPECT_FALSE(trade.holding_days.has_value());
    EXPECT_FALSE(trade.entry_price.has_value());
}
