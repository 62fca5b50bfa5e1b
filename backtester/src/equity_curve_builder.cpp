#include "equity_curve_builder.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace backtester {

    EquityCurveBuilder::EquityCurveBuilder(double starting_capital)
        : starting_capital_(starting_capital) {
        if (starting_capital <= 0) {
            throw std::invalid_argument("Starting capital must be positive.");
        }
    }

    std::vector<EquityPoint> EquityCurveBuilder::build(const PriceSeries& series,
                                                       const std::vector<core::Trade>& trades) const {
        auto logger = core::logging::getLogger();

        std::vector<EquityPoint> curve;
        curve.reserve(series.size());

        // State cursor: seeded flat with the starting capital
        double cash = starting_capital_;
        long long shares = 0;
        std::size_t next_trade = 0;

        for (std::size_t i = 0; i < series.size(); ++i) {
            const core::Candle& candle = series.bar(i);

            if (next_trade < trades.size() && trades[next_trade].timestamp < candle.timestamp) {
                throw core::BacktestException(fmt::format(
                    "Trade at {} does not match any bar timestamp.",
                    core::utils::timestampToString(trades[next_trade].timestamp)));
            }

            EquityPoint point;
            point.timestamp = candle.timestamp;

            if (next_trade < trades.size() && trades[next_trade].timestamp == candle.timestamp) {
                const core::Trade& trade = trades[next_trade];
                cash = trade.cash_after;
                shares = (trade.side == core::TradeSide::Buy) ? trade.shares : 0;
                point.cash = cash;
                point.equity = trade.equity_after;
                point.position_value = trade.equity_after - trade.cash_after;
                ++next_trade;

                if (next_trade < trades.size() && trades[next_trade].timestamp == candle.timestamp) {
                    throw core::BacktestException(fmt::format(
                        "More than one trade recorded at {}.", core::utils::timestampToString(candle.timestamp)));
                }
            } else if (shares > 0) {
                point.cash = cash;
                point.position_value = static_cast<double>(shares) * candle.close;
                point.equity = cash + point.position_value;
            } else {
                point.cash = cash;
                point.equity = cash;
            }
            curve.push_back(point);
        }

        if (next_trade != trades.size()) {
            throw core::BacktestException(fmt::format(
                "{} trade(s) fall after the last bar of the series.", trades.size() - next_trade));
        }

        logger->debug("Equity curve built: {} points, final equity {:.2f}", curve.size(), curve.back().equity);
        return curve;
    }

} // namespace backtester
