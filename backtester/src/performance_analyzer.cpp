#include "performance_analyzer.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace backtester {

    namespace {

        constexpr double kMinStdDev = 1e-12;

        bool isSell(const core::Trade& trade) {
            return trade.side == core::TradeSide::Sell;
        }

        double profitOf(const core::Trade& trade) {
            return trade.profit.value_or(0.0);
        }

    } // namespace

    void PerformanceMetrics::logMetrics() const {
        auto logger = core::logging::getLogger();
        auto flag = [](const Metric& m) { return m.degenerate ? " (undefined, reported as 0)" : ""; };
        logger->info("--- Backtest Metrics ---");
        logger->info("Total Return: {:.2f}%{}", total_return.value * 100.0, flag(total_return));
        logger->info("Annual Return: {:.2f}%{}", annual_return.value * 100.0, flag(annual_return));
        logger->info("Sharpe Ratio: {:.4f}{}", sharpe_ratio.value, flag(sharpe_ratio));
        logger->info("Max Drawdown: {:.2f}%{}", max_drawdown.value * 100.0, flag(max_drawdown));
        logger->info("Win Rate: {:.2f}%{}", win_rate.value * 100.0, flag(win_rate));
        logger->info("Profit Factor: {:.2f}{}", profit_factor.value, flag(profit_factor));
        logger->info("------------------------");
    }

    PerformanceAnalyzer::PerformanceAnalyzer(double initial_capital)
        : initial_capital_(initial_capital) {
        if (initial_capital <= 0) {
            throw std::invalid_argument("Initial capital must be positive.");
        }
    }

    PerformanceMetrics PerformanceAnalyzer::computeMetrics(const std::vector<EquityPoint>& equity_curve,
                                                           const std::vector<core::Trade>& trades) const {
        auto logger = core::logging::getLogger();
        logger->debug("Calculating performance metrics over {} equity points and {} trades...",
                      equity_curve.size(), trades.size());

        PerformanceMetrics metrics;
        metrics.total_return = totalReturn(equity_curve);
        metrics.annual_return = annualReturn(equity_curve, metrics.total_return.value);
        metrics.sharpe_ratio = sharpeRatio(equity_curve);
        metrics.max_drawdown = maxDrawdown(equity_curve);
        metrics.win_rate = winRate(trades);
        metrics.profit_factor = profitFactor(trades);
        return metrics;
    }

    Metric PerformanceAnalyzer::totalReturn(const std::vector<EquityPoint>& equity_curve) const {
        if (equity_curve.empty()) {
            return {0.0, true};
        }
        const double final_equity = equity_curve.back().equity;
        return {(final_equity - initial_capital_) / initial_capital_, false};
    }

    Metric PerformanceAnalyzer::annualReturn(const std::vector<EquityPoint>& equity_curve, double total_return) const {
        if (equity_curve.size() < 2) {
            core::logging::getLogger()->debug("Annual return undefined: fewer than two equity points.");
            return {0.0, true};
        }
        const long long elapsed_days = core::utils::daysBetween(equity_curve.front().timestamp,
                                                                equity_curve.back().timestamp);
        if (elapsed_days <= 0) {
            core::logging::getLogger()->debug("Annual return undefined: zero elapsed calendar days.");
            return {0.0, true};
        }
        return {total_return * (kCalendarDaysPerYear / static_cast<double>(elapsed_days)), false};
    }

    std::vector<double> PerformanceAnalyzer::periodReturns(const std::vector<EquityPoint>& equity_curve) {
        std::vector<double> returns;
        if (equity_curve.size() < 2) {
            return returns;
        }
        returns.reserve(equity_curve.size() - 1);
        for (std::size_t i = 1; i < equity_curve.size(); ++i) {
            const double previous = equity_curve[i - 1].equity;
            if (previous > 0.0) {
                returns.push_back(equity_curve[i].equity / previous - 1.0);
            }
        }
        return returns;
    }

    Metric PerformanceAnalyzer::sharpeRatio(const std::vector<EquityPoint>& equity_curve) const {
        const std::vector<double> returns = periodReturns(equity_curve);
        if (returns.size() < 2) {
            core::logging::getLogger()->debug("Sharpe ratio undefined: {} return observation(s).", returns.size());
            return {0.0, true};
        }

        const double n = static_cast<double>(returns.size());
        const double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / n;
        double sq_dev = 0.0;
        for (double r : returns) {
            sq_dev += (r - mean) * (r - mean);
        }
        const double std_dev = std::sqrt(sq_dev / (n - 1.0)); // Sample standard deviation

        if (!(std_dev > kMinStdDev)) {
            core::logging::getLogger()->debug("Sharpe ratio undefined: zero return variance.");
            return {0.0, true};
        }
        return {mean / std_dev * std::sqrt(kTradingDaysPerYear), false};
    }

    Metric PerformanceAnalyzer::maxDrawdown(const std::vector<EquityPoint>& equity_curve) const {
        double worst = 0.0;
        for (const DrawdownPoint& point : drawdownSeries(equity_curve)) {
            worst = std::min(worst, point.drawdown);
        }
        return {worst, false};
    }

    std::vector<DrawdownPoint> PerformanceAnalyzer::drawdownSeries(const std::vector<EquityPoint>& equity_curve) const {
        std::vector<DrawdownPoint> series;
        series.reserve(equity_curve.size());
        double peak = std::numeric_limits<double>::lowest();
        for (const EquityPoint& point : equity_curve) {
            peak = std::max(peak, point.equity);
            DrawdownPoint dd;
            dd.timestamp = point.timestamp;
            dd.drawdown = (peak > 0.0) ? std::min(0.0, point.equity / peak - 1.0) : 0.0;
            series.push_back(dd);
        }
        return series;
    }

    Metric PerformanceAnalyzer::winRate(const std::vector<core::Trade>& trades) const {
        int sells = 0;
        int winners = 0;
        for (const core::Trade& trade : trades) {
            if (!isSell(trade)) continue;
            ++sells;
            if (profitOf(trade) > 0.0) ++winners;
        }
        if (sells == 0) {
            return {0.0, true};
        }
        return {static_cast<double>(winners) / sells, false};
    }

    Metric PerformanceAnalyzer::profitFactor(const std::vector<core::Trade>& trades) const {
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        for (const core::Trade& trade : trades) {
            if (!isSell(trade)) continue;
            const double profit = profitOf(trade);
            if (profit > 0.0) {
                gross_profit += profit;
            } else if (profit < 0.0) {
                gross_loss += profit;
            }
        }
        // No losing trades: 0 by convention, flagged rather than reported as infinite
        if (gross_loss == 0.0) {
            core::logging::getLogger()->debug("Profit factor undefined: no losing trades (gross profit {:.2f}).", gross_profit);
            return {0.0, true};
        }
        return {std::abs(gross_profit) / std::abs(gross_loss), false};
    }

    TradeStatistics PerformanceAnalyzer::tradeStatistics(const std::vector<core::Trade>& trades) const {
        TradeStatistics stats;
        stats.total_trades = static_cast<int>(trades.size());

        long long holding_sum = 0;
        for (const core::Trade& trade : trades) {
            stats.total_commission += trade.commission;
            if (!isSell(trade)) {
                ++stats.buy_trades;
                continue;
            }
            ++stats.sell_trades;

            const double profit = profitOf(trade);
            if (profit > 0.0) {
                ++stats.winning_trades;
                stats.gross_profit += profit;
                stats.largest_win = std::max(stats.largest_win, profit);
            } else if (profit < 0.0) {
                ++stats.losing_trades;
                stats.gross_loss += profit;
                stats.largest_loss = std::min(stats.largest_loss, profit);
            }

            const int held = trade.holding_days.value_or(1);
            holding_sum += held;
            stats.min_holding_days = (stats.sell_trades == 1) ? held : std::min(stats.min_holding_days, held);
            stats.max_holding_days = std::max(stats.max_holding_days, held);
        }

        stats.avg_win = (stats.winning_trades > 0) ? stats.gross_profit / stats.winning_trades : 0.0;
        stats.avg_loss = (stats.losing_trades > 0) ? stats.gross_loss / stats.losing_trades : 0.0;
        stats.avg_holding_days = (stats.sell_trades > 0)
            ? static_cast<double>(holding_sum) / stats.sell_trades : 0.0;
        return stats;
    }

    MonthlyReturnSummary PerformanceAnalyzer::monthlyReturns(const std::vector<EquityPoint>& equity_curve) const {
        MonthlyReturnSummary summary;

        // Compound growth factor per month; the first bar opens its month at 1.0
        std::vector<double> growth;
        for (std::size_t i = 0; i < equity_curve.size(); ++i) {
            const std::string month = core::utils::timestampToYearMonth(equity_curve[i].timestamp);
            if (summary.months.empty() || summary.months.back().month != month) {
                summary.months.push_back({month, 0.0});
                growth.push_back(1.0);
            }
            if (i > 0 && equity_curve[i - 1].equity > 0.0) {
                growth.back() *= equity_curve[i].equity / equity_curve[i - 1].equity;
            }
        }

        int positive_streak = 0;
        int non_positive_streak = 0;
        for (std::size_t m = 0; m < summary.months.size(); ++m) {
            summary.months[m].value = growth[m] - 1.0;
            if (summary.months[m].value > 0.0) {
                ++summary.positive_months;
                ++positive_streak;
                non_positive_streak = 0;
            } else {
                ++summary.non_positive_months;
                ++non_positive_streak;
                positive_streak = 0;
            }
            summary.max_consecutive_positive = std::max(summary.max_consecutive_positive, positive_streak);
            summary.max_consecutive_non_positive = std::max(summary.max_consecutive_non_positive, non_positive_streak);
        }
        return summary;
    }

} // namespace backtester
