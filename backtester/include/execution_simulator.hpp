#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "backtest_config.hpp"
#include "price_series.hpp"

namespace backtester {

    // Cash plus the optional open position. Threaded through the run by value.
    struct AccountState {
        double cash = 0.0;
        std::optional<core::Position> position;

        bool isOpen() const { return position.has_value() && position->shares > 0; }
    };

    enum class SkipReason {
        InsufficientCapital,  // BUY sized to zero shares
        AlreadyInPosition,    // BUY while long, no pyramiding
        NoOpenPosition,       // SELL while flat
        InvalidSignalValue    // Outside {-1, 0, 1}, treated as 0
    };

    std::string toString(SkipReason reason);

    // A signal that did not produce a trade. Informational, never an error.
    struct SkippedSignal {
        std::size_t bar_index = 0;
        core::Timestamp timestamp;
        int raw_signal = 0;
        SkipReason reason = SkipReason::InvalidSignalValue;
    };

    struct ExecutionResult {
        std::vector<core::Trade> trades;
        AccountState final_state;
        std::vector<SkippedSignal> skipped_signals;
    };

    // Single forward pass converting the signal column into BUY/SELL executions.
    class ExecutionSimulator {
    public:
        explicit ExecutionSimulator(BacktestConfig config);

        ExecutionResult run(const PriceSeries& series) const;

        const BacktestConfig& config() const { return config_; }

    private:
        BacktestConfig config_;

        // One step of the fold: consumes the prior state, returns the next one.
        AccountState step(AccountState state,
                          const PriceSeries& series,
                          std::size_t index,
                          ExecutionResult& out) const;

        AccountState executeBuy(AccountState state, const PriceSeries& series,
                                std::size_t index, ExecutionResult& out) const;
        AccountState executeSell(AccountState state, const PriceSeries& series,
                                 std::size_t index, ExecutionResult& out) const;

        void recordSkip(ExecutionResult& out, const PriceSeries& series,
                        std::size_t index, SkipReason reason) const;
    };

} // namespace backtester
