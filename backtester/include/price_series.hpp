#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "datatypes.hpp"

namespace backtester {

    // Validated, immutable bar sequence with its parallel signal column and
    // optional per-bar position-size hints. Length is fixed after construction.
    class PriceSeries {
    public:
        // Throws core::InvalidSeriesException if the series is empty, the
        // columns differ in length, timestamps are not strictly increasing,
        // a price is non-positive or non-finite, a volume is negative, or a
        // size hint lies outside (0, 1]. Input is never repaired.
        PriceSeries(std::vector<core::Candle> bars,
                    std::vector<int> signals,
                    std::vector<std::optional<double>> size_hints = {});

        std::size_t size() const { return bars_.size(); }

        const core::Candle& bar(std::size_t index) const { return bars_.at(index); }
        int signal(std::size_t index) const { return signals_.at(index); }
        // Empty when no hint was supplied for this bar
        std::optional<double> sizeHint(std::size_t index) const;

        const core::TimeSeries<core::Candle>& bars() const { return bars_; }
        const std::vector<int>& signals() const { return signals_; }

        core::Timestamp firstTimestamp() const { return bars_.front().timestamp; }
        core::Timestamp lastTimestamp() const { return bars_.back().timestamp; }

        using const_iterator = core::TimeSeries<core::Candle>::const_iterator;
        const_iterator begin() const { return bars_.begin(); }
        const_iterator end() const { return bars_.end(); }

        // Bars with start <= timestamp <= end (either bound optional).
        // Throws core::InvalidSeriesException when nothing remains.
        PriceSeries slice(const std::optional<core::Timestamp>& start,
                          const std::optional<core::Timestamp>& end) const;

    private:
        core::TimeSeries<core::Candle> bars_;
        std::vector<int> signals_;
        std::vector<std::optional<double>> size_hints_; // Empty or same length as bars_

        void validate() const;
    };

} // namespace backtester
