#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"

namespace backtester {

    using json = nlohmann::json;

    // Every policy knob of a run in one place. Passed by value into the
    // simulator; nothing reads a global default.
    struct BacktestConfig {
        double starting_capital = 100000.0;
        double position_size_fraction = 1.0;   // Share of available cash per BUY, (0, 1]
        int price_rounding_decimals = 2;
        double commission_rate = 0.0;          // Flat rate on executed notional, both legs

        // Inclusive bar filter applied before the run
        std::optional<core::Timestamp> start_date;
        std::optional<core::Timestamp> end_date;

        // Throws core::ConfigException on the first violated constraint
        void validate() const;
    };

    // Opens and parses a JSON config file. Throws core::ConfigException when
    // the file cannot be read or is not valid JSON.
    json readConfigJson(const std::string& path);

    BacktestConfig loadConfigFromJson(const json& config);
    BacktestConfig loadConfigFromFile(const std::string& path);

    json toJson(const BacktestConfig& config);

} // namespace backtester
