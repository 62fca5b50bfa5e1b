#include "test_helpers.hpp"
#include "utils.hpp"

#include <chrono>

namespace backtester {
namespace test_support {

    core::Timestamp dayAt(int day_offset, const std::string& start) {
        return core::utils::stringToTimestamp(start) + std::chrono::hours(24 * day_offset);
    }

    std::vector<core::Candle> dailyBars(const std::vector<double>& closes, const std::string& start) {
        std::vector<core::Candle> bars;
        bars.reserve(closes.size());
        for (std::size_t i = 0; i < closes.size(); ++i) {
            core::Candle candle;
            candle.timestamp = dayAt(static_cast<int>(i), start);
            candle.open = closes[i];
            candle.high = closes[i];
            candle.low = closes[i];
            candle.close = closes[i];
            candle.volume = 1000;
            bars.push_back(candle);
        }
        return bars;
    }

    PriceSeries makeSeries(const std::vector<double>& closes,
                           const std::vector<int>& signals,
                           const std::string& start) {
        return PriceSeries(dailyBars(closes, start), signals);
    }

    BacktestConfig makeConfig(double starting_capital) {
        BacktestConfig config;
        config.starting_capital = starting_capital;
        return config;
    }

} // namespace test_support
} // namespace backtester
