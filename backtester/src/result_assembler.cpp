#include "result_assembler.hpp"
#include "utils.hpp"

#include <utility>

namespace backtester {

    BacktestResult ResultAssembler::assemble(const BacktestConfig& config,
                                             const PriceSeries& series,
                                             ExecutionResult execution,
                                             std::vector<EquityPoint> equity_curve,
                                             const PerformanceMetrics& metrics,
                                             std::vector<DrawdownPoint> drawdowns,
                                             const TradeStatistics& trade_stats,
                                             MonthlyReturnSummary monthly_returns) {
        BacktestResult result;
        result.config = config;
        result.initial_capital = config.starting_capital;
        result.final_equity = equity_curve.empty() ? config.starting_capital : equity_curve.back().equity;
        result.trades = std::move(execution.trades);
        result.equity_curve = std::move(equity_curve);
        result.metrics = metrics;
        result.skipped_signals = std::move(execution.skipped_signals);
        result.signal_summary = summarizeSignals(series);
        result.drawdowns = std::move(drawdowns);
        result.trade_stats = trade_stats;
        result.monthly_returns = std::move(monthly_returns);

        if (execution.final_state.isOpen()) {
            OpenPositionReport report;
            report.position = *execution.final_state.position;
            report.last_close = series.bar(series.size() - 1).close;
            report.market_value = static_cast<double>(report.position.shares) * report.last_close;
            report.unrealized_profit = report.market_value
                - static_cast<double>(report.position.shares) * report.position.entry_price;
            result.open_position = report;
        }
        return result;
    }

    SignalSummary ResultAssembler::summarizeSignals(const PriceSeries& series) {
        SignalSummary summary;
        for (int raw : series.signals()) {
            switch (raw) {
                case 1:  ++summary.buy_signals; break;
                case -1: ++summary.sell_signals; break;
                case 0:  ++summary.neutral_bars; break;
                default: ++summary.malformed_signals; break;
            }
        }
        return summary;
    }

    json toJson(const core::Trade& trade) {
        json j = {
            {"timestamp", core::utils::timestampToString(trade.timestamp)},
            {"side", core::toString(trade.side)},
            {"price", trade.price},
            {"shares", trade.shares},
            {"value", trade.value},
            {"commission", trade.commission},
            {"cash_before", trade.cash_before},
            {"cash_after", trade.cash_after},
            {"equity_before", trade.equity_before},
            {"equity_after", trade.equity_after}
        };
        // SELL-only fields are omitted on BUY records
        if (trade.profit) j["profit"] = *trade.profit;
        if (trade.profit_percent) j["profit_percent"] = *trade.profit_percent;
        if (trade.holding_days) j["holding_days"] = *trade.holding_days;
        if (trade.entry_price) j["entry_price"] = *trade.entry_price;
        return j;
    }

    json toJson(const PerformanceMetrics& metrics) {
        json j = {
            {"total_return", metrics.total_return.value},
            {"annual_return", metrics.annual_return.value},
            {"sharpe_ratio", metrics.sharpe_ratio.value},
            {"max_drawdown", metrics.max_drawdown.value},
            {"win_rate", metrics.win_rate.value},
            {"profit_factor", metrics.profit_factor.value},
            {"degenerate", {
                {"total_return", metrics.total_return.degenerate},
                {"annual_return", metrics.annual_return.degenerate},
                {"sharpe_ratio", metrics.sharpe_ratio.degenerate},
                {"max_drawdown", metrics.max_drawdown.degenerate},
                {"win_rate", metrics.win_rate.degenerate},
                {"profit_factor", metrics.profit_factor.degenerate}
            }}
        };
        return j;
    }

    json toJson(const BacktestResult& result) {
        json j;
        j["config"] = toJson(result.config);
        j["initial_capital"] = result.initial_capital;
        j["final_equity"] = result.final_equity;

        j["trades"] = json::array();
        for (const auto& trade : result.trades) {
            j["trades"].push_back(toJson(trade));
        }

        j["equity_curve"] = json::array();
        for (const auto& point : result.equity_curve) {
            j["equity_curve"].push_back({
                {"timestamp", core::utils::timestampToString(point.timestamp)},
                {"equity", point.equity}
            });
        }

        j["metrics"] = toJson(result.metrics);

        j["diagnostics"] = json::array();
        for (const auto& skipped : result.skipped_signals) {
            j["diagnostics"].push_back({
                {"bar_index", skipped.bar_index},
                {"timestamp", core::utils::timestampToString(skipped.timestamp)},
                {"signal", skipped.raw_signal},
                {"reason", toString(skipped.reason)}
            });
        }

        j["signal_summary"] = {
            {"buy_signals", result.signal_summary.buy_signals},
            {"sell_signals", result.signal_summary.sell_signals},
            {"neutral_bars", result.signal_summary.neutral_bars},
            {"malformed_signals", result.signal_summary.malformed_signals}
        };

        j["drawdowns"] = json::array();
        for (const auto& dd : result.drawdowns) {
            j["drawdowns"].push_back({
                {"timestamp", core::utils::timestampToString(dd.timestamp)},
                {"drawdown", dd.drawdown}
            });
        }

        const TradeStatistics& stats = result.trade_stats;
        j["trade_stats"] = {
            {"total_trades", stats.total_trades},
            {"buy_trades", stats.buy_trades},
            {"sell_trades", stats.sell_trades},
            {"winning_trades", stats.winning_trades},
            {"losing_trades", stats.losing_trades},
            {"gross_profit", stats.gross_profit},
            {"gross_loss", stats.gross_loss},
            {"avg_win", stats.avg_win},
            {"avg_loss", stats.avg_loss},
            {"largest_win", stats.largest_win},
            {"largest_loss", stats.largest_loss},
            {"avg_holding_days", stats.avg_holding_days},
            {"min_holding_days", stats.min_holding_days},
            {"max_holding_days", stats.max_holding_days},
            {"total_commission", stats.total_commission}
        };

        json months = json::array();
        for (const auto& month : result.monthly_returns.months) {
            months.push_back({{"month", month.month}, {"return", month.value}});
        }
        j["monthly_returns"] = {
            {"months", months},
            {"positive_months", result.monthly_returns.positive_months},
            {"non_positive_months", result.monthly_returns.non_positive_months},
            {"max_consecutive_positive", result.monthly_returns.max_consecutive_positive},
            {"max_consecutive_non_positive", result.monthly_returns.max_consecutive_non_positive}
        };

        if (result.open_position) {
            const OpenPositionReport& open = *result.open_position;
            j["open_position"] = {
                {"entry_timestamp", core::utils::timestampToString(open.position.entry_time)},
                {"entry_price", open.position.entry_price},
                {"shares", open.position.shares},
                {"last_close", open.last_close},
                {"market_value", open.market_value},
                {"unrealized_profit", open.unrealized_profit}
            };
        } else {
            j["open_position"] = nullptr;
        }
        return j;
    }

} // namespace backtester
