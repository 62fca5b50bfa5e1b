#include "execution_simulator.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace backtester {

    std::string toString(SkipReason reason) {
        switch (reason) {
            case SkipReason::InsufficientCapital: return "InsufficientCapital";
            case SkipReason::AlreadyInPosition:   return "AlreadyInPosition";
            case SkipReason::NoOpenPosition:      return "NoOpenPosition";
            case SkipReason::InvalidSignalValue:  return "InvalidSignalValue";
        }
        return "Unknown";
    }

    ExecutionSimulator::ExecutionSimulator(BacktestConfig config)
        : config_(std::move(config))
    {
        config_.validate();
        core::logging::getLogger()->debug("ExecutionSimulator initialized: capital={:.2f}, size_fraction={}, decimals={}, commission_rate={}",
                                          config_.starting_capital, config_.position_size_fraction,
                                          config_.price_rounding_decimals, config_.commission_rate);
    }

    ExecutionResult ExecutionSimulator::run(const PriceSeries& series) const {
        auto logger = core::logging::getLogger();
        logger->debug("Simulating executions over {} bars", series.size());

        ExecutionResult out;
        AccountState state;
        state.cash = config_.starting_capital;

        for (std::size_t i = 0; i < series.size(); ++i) {
            state = step(std::move(state), series, i, out);
        }
        out.final_state = std::move(state);

        logger->info("Simulation finished: {} executions, {} skipped signals, final cash {:.2f}, position {}",
                     out.trades.size(), out.skipped_signals.size(), out.final_state.cash,
                     out.final_state.isOpen() ? fmt::format("{} shares", out.final_state.position->shares)
                                              : std::string("flat"));
        return out;
    }

    AccountState ExecutionSimulator::step(AccountState state,
                                          const PriceSeries& series,
                                          std::size_t index,
                                          ExecutionResult& out) const {
        const int raw = series.signal(index);
        if (raw < -1 || raw > 1) {
            recordSkip(out, series, index, SkipReason::InvalidSignalValue);
            return state;
        }

        switch (core::signalFromInt(raw)) {
            case core::SignalAction::EnterLong: {
                if (state.isOpen()) {
                    recordSkip(out, series, index, SkipReason::AlreadyInPosition);
                    return state;
                }
                return executeBuy(std::move(state), series, index, out);
            }
            case core::SignalAction::ExitLong: {
                if (!state.isOpen()) {
                    recordSkip(out, series, index, SkipReason::NoOpenPosition);
                    return state;
                }
                return executeSell(std::move(state), series, index, out);
            }
            case core::SignalAction::None:
            default:
                return state;
        }
    }

    AccountState ExecutionSimulator::executeBuy(AccountState state, const PriceSeries& series,
                                                std::size_t index, ExecutionResult& out) const {
        auto logger = core::logging::getLogger();
        const core::Candle& candle = series.bar(index);
        const int decimals = config_.price_rounding_decimals;
        const double rate = config_.commission_rate;

        const double price = core::utils::roundTo(candle.close, decimals);
        const double fraction = series.sizeHint(index).value_or(config_.position_size_fraction);
        const double available = state.cash * fraction;

        long long shares = 0;
        if (price > 0.0) {
            shares = static_cast<long long>(std::floor(available / (price * (1.0 + rate))));
        }

        double value = core::utils::roundTo(static_cast<double>(shares) * price, decimals);
        double commission = core::utils::roundTo(value * rate, decimals);
        // Rounding of value/commission must never push cash below zero
        while (shares > 0 && value + commission > state.cash + 1e-9) {
            --shares;
            value = core::utils::roundTo(static_cast<double>(shares) * price, decimals);
            commission = core::utils::roundTo(value * rate, decimals);
        }

        if (shares <= 0) {
            logger->warn("Insufficient capital to buy at {}: available {:.2f}, price {:.2f}. Signal skipped.",
                         core::utils::timestampToString(candle.timestamp), available, price);
            recordSkip(out, series, index, SkipReason::InsufficientCapital);
            return state;
        }

        core::Trade trade;
        trade.side = core::TradeSide::Buy;
        trade.timestamp = candle.timestamp;
        trade.bar_index = index;
        trade.price = price;
        trade.shares = shares;
        trade.value = value;
        trade.commission = commission;
        trade.cash_before = state.cash;
        trade.equity_before = state.cash; // Flat before a BUY

        state.cash = core::utils::roundTo(state.cash - value - commission, decimals);

        trade.cash_after = state.cash;
        trade.equity_after = core::utils::roundTo(state.cash + static_cast<double>(shares) * price, decimals);

        core::Position position;
        position.entry_time = candle.timestamp;
        position.entry_price = price;
        position.shares = shares;
        position.entry_commission = commission;
        state.position = position;

        logger->info("Trade Executed: Time={}, Side=BUY, Shares={}, Price={:.2f}, Value={:.2f}, Comm={:.2f}, Cash {:.2f} -> {:.2f}",
                     core::utils::timestampToString(trade.timestamp), shares, price, value, commission,
                     trade.cash_before, trade.cash_after);

        out.trades.push_back(std::move(trade));
        return state;
    }

    AccountState ExecutionSimulator::executeSell(AccountState state, const PriceSeries& series,
                                                 std::size_t index, ExecutionResult& out) const {
        auto logger = core::logging::getLogger();
        const core::Candle& candle = series.bar(index);
        const int decimals = config_.price_rounding_decimals;
        const core::Position position = *state.position;

        const double price = core::utils::roundTo(candle.close, decimals);
        const double shares = static_cast<double>(position.shares);
        const double value = core::utils::roundTo(shares * price, decimals);
        const double commission = core::utils::roundTo(value * config_.commission_rate, decimals);
        const double cost_basis = shares * position.entry_price;

        core::Trade trade;
        trade.side = core::TradeSide::Sell;
        trade.timestamp = candle.timestamp;
        trade.bar_index = index;
        trade.price = price;
        trade.shares = position.shares;
        trade.value = value;
        trade.commission = commission;
        trade.cash_before = state.cash;
        trade.equity_before = core::utils::roundTo(state.cash + cost_basis, decimals); // Position at cost
        trade.profit = core::utils::roundTo(value - cost_basis - position.entry_commission - commission, decimals);
        trade.profit_percent = (price - position.entry_price) / position.entry_price;
        trade.holding_days = static_cast<int>(std::max<long long>(1, core::utils::daysBetween(position.entry_time, candle.timestamp)));
        trade.entry_price = position.entry_price;

        state.cash = core::utils::roundTo(state.cash + value - commission, decimals);
        state.position.reset();

        trade.cash_after = state.cash;
        trade.equity_after = state.cash;

        logger->info("Trade Executed: Time={}, Side=SELL, Shares={}, Price={:.2f}, Value={:.2f}, Comm={:.2f}, Profit={:.2f} ({:.2f}%), Held={}d, Cash {:.2f} -> {:.2f}",
                     core::utils::timestampToString(trade.timestamp), trade.shares, price, value, commission,
                     *trade.profit, *trade.profit_percent * 100.0, *trade.holding_days,
                     trade.cash_before, trade.cash_after);

        out.trades.push_back(std::move(trade));
        return state;
    }

    void ExecutionSimulator::recordSkip(ExecutionResult& out, const PriceSeries& series,
                                        std::size_t index, SkipReason reason) const {
        SkippedSignal skipped;
        skipped.bar_index = index;
        skipped.timestamp = series.bar(index).timestamp;
        skipped.raw_signal = series.signal(index);
        skipped.reason = reason;

        auto logger = core::logging::getLogger();
        if (reason == SkipReason::InvalidSignalValue) {
            logger->warn("Malformed signal value {} at {} treated as no action.",
                         skipped.raw_signal, core::utils::timestampToString(skipped.timestamp));
        } else if (reason != SkipReason::InsufficientCapital) {
            logger->debug("Ignoring signal {} at {}: {}", skipped.raw_signal,
                          core::utils::timestampToString(skipped.timestamp), toString(reason));
        }
        out.skipped_signals.push_back(skipped);
    }

} // namespace backtester
