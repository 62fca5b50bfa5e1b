#pragma once

#include <istream>
#include <string>

#include "price_series.hpp"

namespace data {

    // Reads bars and their signal column from CSV.
    //
    // A header row is required and names the columns (case-insensitive, any
    // order): date, open, high, low, close, volume, signal, and optionally
    // position_size. Blank lines are skipped. Dates are YYYY-MM-DD or ISO 8601.
    // Unparseable fields raise core::DataLoadException with the line number;
    // the parsed rows are then validated by PriceSeries without repair.
    class CsvLoader {
    public:
        static backtester::PriceSeries loadFile(const std::string& path);
        static backtester::PriceSeries load(std::istream& input, const std::string& source_name = "<stream>");
    };

} // namespace data
