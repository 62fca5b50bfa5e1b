#include "backtester.hpp"
#include "equity_curve_builder.hpp"
#include "execution_simulator.hpp"
#include "performance_analyzer.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <utility>

namespace backtester {

    Backtester::Backtester(BacktestConfig config)
        : config_(std::move(config))
    {
        config_.validate();
        core::logging::getLogger()->debug("Backtester initialized with capital: {}", config_.starting_capital);
    }

    BacktestResult Backtester::run(const PriceSeries& input) const {
        auto logger = core::logging::getLogger();
        logger->info("========================================================");
        logger->info("Starting Backtest Run");
        logger->info("========================================================");
        logger->info("Config: {}", toJson(config_).dump());

        const bool filtered = config_.start_date.has_value() || config_.end_date.has_value();
        const PriceSeries series = filtered ? input.slice(config_.start_date, config_.end_date) : input;
        logger->info("Period: {} to {} ({} bars)",
                     core::utils::timestampToString(series.firstTimestamp()),
                     core::utils::timestampToString(series.lastTimestamp()),
                     series.size());

        // 1. Executions
        ExecutionSimulator simulator(config_);
        ExecutionResult execution = simulator.run(series);

        // 2. Equity curve
        EquityCurveBuilder curve_builder(config_.starting_capital);
        std::vector<EquityPoint> equity_curve = curve_builder.build(series, execution.trades);

        // 3. Metrics
        PerformanceAnalyzer analyzer(config_.starting_capital);
        PerformanceMetrics metrics = analyzer.computeMetrics(equity_curve, execution.trades);
        std::vector<DrawdownPoint> drawdowns = analyzer.drawdownSeries(equity_curve);
        TradeStatistics trade_stats = analyzer.tradeStatistics(execution.trades);
        MonthlyReturnSummary monthly = analyzer.monthlyReturns(equity_curve);

        metrics.logMetrics();
        logger->info("Trades: {} ({} buys, {} sells), skipped signals: {}",
                     trade_stats.total_trades, trade_stats.buy_trades, trade_stats.sell_trades,
                     execution.skipped_signals.size());

        // 4. Package
        BacktestResult result = ResultAssembler::assemble(config_, series, std::move(execution),
                                                          std::move(equity_curve), metrics,
                                                          std::move(drawdowns), trade_stats,
                                                          std::move(monthly));

        logger->info("========================================================");
        logger->info("Backtest Run Completed. Final equity {:.2f}", result.final_equity);
        logger->info("========================================================");
        return result;
    }

} // namespace backtester
