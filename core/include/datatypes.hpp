#pragma once

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <optional>

namespace core {

    // Using system_clock for time points; all timestamps are treated as UTC
    using Timestamp = std::chrono::system_clock::time_point;


    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Decoded form of the integer signal column (1 / -1 / 0)
    enum class SignalAction {
        None,
        EnterLong,
        ExitLong
    };

    enum class TradeSide {
        Buy,
        Sell
    };

    // The single open long position. shares > 0 <=> open.
    struct Position {
        Timestamp entry_time;
        double entry_price = 0.0;
        long long shares = 0;
        double entry_commission = 0.0; // Commission paid on the BUY leg
    };

    // One execution. Created once by the simulator and never mutated.
    struct Trade {
        TradeSide side = TradeSide::Buy;
        Timestamp timestamp;
        std::size_t bar_index = 0;
        double price = 0.0;           // Execution price, rounded
        long long shares = 0;
        double value = 0.0;           // shares * price, rounded
        double commission = 0.0;      // Commission for this leg
        double cash_before = 0.0;
        double cash_after = 0.0;
        double equity_before = 0.0;
        double equity_after = 0.0;

        // SELL only
        std::optional<double> profit;         // Net of entry and exit commission
        std::optional<double> profit_percent; // (price - entry) / entry, as a fraction
        std::optional<int> holding_days;      // At least 1
        std::optional<double> entry_price;
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    SignalAction signalFromInt(int raw);
    std::string toString(TradeSide side);

} // namespace core
