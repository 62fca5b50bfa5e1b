#pragma once

#include <vector>

#include "datatypes.hpp"
#include "price_series.hpp"

namespace backtester {

    // Portfolio value at one bar
    struct EquityPoint {
        core::Timestamp timestamp;
        double cash = 0.0;
        double position_value = 0.0; // Mark-to-market of the open position, 0 if flat
        double equity = 0.0;         // cash + position_value, or the trade's recorded equity
    };

    // Rebuilds one EquityPoint per bar from the trade log.
    //
    // On a bar with a trade the trade's equity_after is adopted as-is, so the
    // curve and the log agree exactly at every execution. Between trades an
    // open position is marked at the bar's close. If the run ends long, the
    // last point carries the unrealized value at the final close.
    class EquityCurveBuilder {
    public:
        explicit EquityCurveBuilder(double starting_capital);

        // Throws core::BacktestException if a trade does not line up with a
        // bar timestamp or the trades are out of order.
        std::vector<EquityPoint> build(const PriceSeries& series,
                                       const std::vector<core::Trade>& trades) const;

    private:
        double starting_capital_;
    };

} // namespace backtester
