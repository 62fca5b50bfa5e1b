#pragma once

#include <string>
#include <vector>

#include "datatypes.hpp"
#include "equity_curve_builder.hpp"

namespace backtester {

    // A metric value plus whether it fell back to the 0 default because its
    // denominator was zero (no elapsed days, no variance, no sells, no losses).
    struct Metric {
        double value = 0.0;
        bool degenerate = false;
    };

    // --- Headline metrics. Ratios are fractions (0.25 == 25%). ---
    struct PerformanceMetrics {
        Metric total_return;
        Metric annual_return;
        Metric sharpe_ratio;
        Metric max_drawdown;   // <= 0
        Metric win_rate;
        Metric profit_factor;

        void logMetrics() const;
    };

    struct DrawdownPoint {
        core::Timestamp timestamp;
        double drawdown = 0.0; // equity / running peak - 1
    };

    struct TradeStatistics {
        int total_trades = 0;
        int buy_trades = 0;
        int sell_trades = 0;
        int winning_trades = 0;      // SELLs with profit > 0
        int losing_trades = 0;       // SELLs with profit < 0
        double gross_profit = 0.0;
        double gross_loss = 0.0;     // Sum of losing profits, <= 0
        double avg_win = 0.0;
        double avg_loss = 0.0;       // <= 0
        double largest_win = 0.0;
        double largest_loss = 0.0;   // <= 0
        double avg_holding_days = 0.0;
        int min_holding_days = 0;
        int max_holding_days = 0;
        double total_commission = 0.0;
    };

    struct MonthlyReturn {
        std::string month; // YYYY-MM, UTC
        double value = 0.0;
    };

    struct MonthlyReturnSummary {
        std::vector<MonthlyReturn> months; // Chronological
        int positive_months = 0;
        int non_positive_months = 0;
        int max_consecutive_positive = 0;
        int max_consecutive_non_positive = 0;
    };

    // Pure functions over (equity curve, trade log). Never looks at signals.
    class PerformanceAnalyzer {
    public:
        static constexpr double kTradingDaysPerYear = 252.0;
        static constexpr double kCalendarDaysPerYear = 365.0;

        explicit PerformanceAnalyzer(double initial_capital);

        PerformanceMetrics computeMetrics(const std::vector<EquityPoint>& equity_curve,
                                          const std::vector<core::Trade>& trades) const;

        std::vector<DrawdownPoint> drawdownSeries(const std::vector<EquityPoint>& equity_curve) const;
        TradeStatistics tradeStatistics(const std::vector<core::Trade>& trades) const;
        MonthlyReturnSummary monthlyReturns(const std::vector<EquityPoint>& equity_curve) const;

        // Bar-over-bar equity returns; bars following a non-positive equity are skipped
        static std::vector<double> periodReturns(const std::vector<EquityPoint>& equity_curve);

    private:
        double initial_capital_;

        Metric totalReturn(const std::vector<EquityPoint>& equity_curve) const;
        Metric annualReturn(const std::vector<EquityPoint>& equity_curve, double total_return) const;
        Metric sharpeRatio(const std::vector<EquityPoint>& equity_curve) const;
        Metric maxDrawdown(const std::vector<EquityPoint>& equity_curve) const;
        Metric winRate(const std::vector<core::Trade>& trades) const;
        Metric profitFactor(const std::vector<core::Trade>& trades) const;
    };

} // namespace backtester
