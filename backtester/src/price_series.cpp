#include "price_series.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <cmath>
#include <utility>

namespace backtester {

    namespace {

        bool isValidPrice(double price) {
            return std::isfinite(price) && price > 0.0;
        }

    } // namespace

    PriceSeries::PriceSeries(std::vector<core::Candle> bars,
                             std::vector<int> signals,
                             std::vector<std::optional<double>> size_hints)
        : bars_(std::move(bars)), signals_(std::move(signals)), size_hints_(std::move(size_hints))
    {
        validate();
        core::logging::getLogger()->trace("PriceSeries created with {} bars ({} to {})",
                                          bars_.size(),
                                          core::utils::timestampToString(firstTimestamp()),
                                          core::utils::timestampToString(lastTimestamp()));
    }

    void PriceSeries::validate() const {
        if (bars_.empty()) {
            throw core::InvalidSeriesException("Price series is empty.");
        }
        if (signals_.size() != bars_.size()) {
            throw core::InvalidSeriesException(fmt::format(
                "Signal column length ({}) does not match bar count ({}).", signals_.size(), bars_.size()));
        }
        if (!size_hints_.empty() && size_hints_.size() != bars_.size()) {
            throw core::InvalidSeriesException(fmt::format(
                "Position-size column length ({}) does not match bar count ({}).", size_hints_.size(), bars_.size()));
        }

        for (std::size_t i = 0; i < bars_.size(); ++i) {
            const core::Candle& candle = bars_[i];
            if (i > 0 && !(bars_[i - 1].timestamp < candle.timestamp)) {
                throw core::InvalidSeriesException(fmt::format(
                    "Timestamps not strictly increasing at bar {} ({}).", i, core::utils::timestampToString(candle.timestamp)));
            }
            if (!isValidPrice(candle.close)) {
                throw core::InvalidSeriesException(fmt::format("Non-positive close price {} at bar {}.", candle.close, i));
            }
            if (!isValidPrice(candle.open) || !isValidPrice(candle.high) || !isValidPrice(candle.low)) {
                throw core::InvalidSeriesException(fmt::format("Non-positive open/high/low price at bar {}.", i));
            }
            if (candle.volume < 0) {
                throw core::InvalidSeriesException(fmt::format("Negative volume {} at bar {}.", candle.volume, i));
            }
            if (!size_hints_.empty() && size_hints_[i]) {
                double hint = *size_hints_[i];
                if (!std::isfinite(hint) || hint <= 0.0 || hint > 1.0) {
                    throw core::InvalidSeriesException(fmt::format("Position-size hint {} at bar {} is outside (0, 1].", hint, i));
                }
            }
        }
    }

    std::optional<double> PriceSeries::sizeHint(std::size_t index) const {
        if (size_hints_.empty()) {
            return std::nullopt;
        }
        return size_hints_.at(index);
    }

    PriceSeries PriceSeries::slice(const std::optional<core::Timestamp>& start,
                                   const std::optional<core::Timestamp>& end) const {
        core::TimeSeries<core::Candle> bars;
        std::vector<int> signals;
        std::vector<std::optional<double>> hints;

        for (std::size_t i = 0; i < bars_.size(); ++i) {
            const auto& ts = bars_[i].timestamp;
            if (start && ts < *start) continue;
            if (end && ts > *end) continue;
            bars.push_back(bars_[i]);
            signals.push_back(signals_[i]);
            if (!size_hints_.empty()) {
                hints.push_back(size_hints_[i]);
            }
        }
        if (bars.empty()) {
            throw core::InvalidSeriesException("No bars fall inside the requested date range.");
        }
        return PriceSeries(std::move(bars), std::move(signals), std::move(hints));
    }

} // namespace backtester
