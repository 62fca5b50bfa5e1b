#pragma once

#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "backtest_config.hpp"
#include "price_series.hpp"
#include "execution_simulator.hpp"
#include "equity_curve_builder.hpp"
#include "performance_analyzer.hpp"

namespace backtester {

    using json = nlohmann::json;

    struct SignalSummary {
        int buy_signals = 0;
        int sell_signals = 0;
        int neutral_bars = 0;
        int malformed_signals = 0;
    };

    // Position still held when the series ended, valued at the final close
    struct OpenPositionReport {
        core::Position position;
        double last_close = 0.0;
        double market_value = 0.0;
        double unrealized_profit = 0.0;
    };

    // The engine's single output value
    struct BacktestResult {
        BacktestConfig config;
        double initial_capital = 0.0;
        double final_equity = 0.0;
        std::vector<core::Trade> trades;
        std::vector<EquityPoint> equity_curve;
        PerformanceMetrics metrics;
        std::vector<SkippedSignal> skipped_signals;
        SignalSummary signal_summary;
        std::vector<DrawdownPoint> drawdowns;
        TradeStatistics trade_stats;
        MonthlyReturnSummary monthly_returns;
        std::optional<OpenPositionReport> open_position;
    };

    // Packages the stage outputs. Side-effect free.
    class ResultAssembler {
    public:
        static BacktestResult assemble(const BacktestConfig& config,
                                       const PriceSeries& series,
                                       ExecutionResult execution,
                                       std::vector<EquityPoint> equity_curve,
                                       const PerformanceMetrics& metrics,
                                       std::vector<DrawdownPoint> drawdowns,
                                       const TradeStatistics& trade_stats,
                                       MonthlyReturnSummary monthly_returns);

        static SignalSummary summarizeSignals(const PriceSeries& series);
    };

    json toJson(const core::Trade& trade);
    json toJson(const PerformanceMetrics& metrics);
    json toJson(const BacktestResult& result);

} // namespace backtester
