#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "backtest_config.hpp"
#include "price_series.hpp"
#include "result_assembler.hpp"

namespace backtester {

    struct BacktestJob {
        std::string name;
        BacktestConfig config;
        PriceSeries series;
    };

    struct BatchResult {
        std::string name;
        std::optional<BacktestResult> result; // Empty when the job was rejected
        std::string error;

        bool ok() const { return result.has_value(); }
    };

    // Runs independent backtests on a bounded set of worker threads. Jobs
    // share nothing mutable; results come back in job order.
    class BatchRunner {
    public:
        // 0 means one worker per hardware thread
        explicit BatchRunner(std::size_t max_workers = 0);

        // Config and series errors are reported per job. Any other exception
        // is rethrown after all workers have joined.
        std::vector<BatchResult> run(const std::vector<BacktestJob>& jobs) const;

        std::size_t maxWorkers() const { return max_workers_; }

    private:
        std::size_t max_workers_;
    };

} // namespace backtester
