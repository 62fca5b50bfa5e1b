#pragma once

#include "backtest_config.hpp"
#include "price_series.hpp"
#include "result_assembler.hpp"

namespace backtester {

    // Runs the full pipeline for one series:
    // PriceSeries -> ExecutionSimulator -> EquityCurveBuilder -> PerformanceAnalyzer -> ResultAssembler.
    // Deterministic: the same series and config always give the same result.
    class Backtester {
    public:
        // Throws core::ConfigException if the config is invalid
        explicit Backtester(BacktestConfig config);

        // Throws core::InvalidSeriesException if the date range leaves no bars
        BacktestResult run(const PriceSeries& series) const;

        const BacktestConfig& getConfig() const { return config_; }

    private:
        BacktestConfig config_;
    };

} // namespace backtester
