#include "csv_loader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace data {

    namespace {

        const std::vector<std::string> kRequiredColumns = {
            "date", "open", "high", "low", "close", "volume", "signal"
        };
        const std::string kSizeColumn = "position_size";

        std::string trim(const std::string& s) {
            auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
            auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
            return (begin < end) ? std::string(begin, end) : std::string();
        }

        std::string toLower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::vector<std::string> splitLine(const std::string& line) {
            std::vector<std::string> fields;
            std::stringstream ss(line);
            std::string field;
            while (std::getline(ss, field, ',')) {
                fields.push_back(trim(field));
            }
            if (!line.empty() && line.back() == ',') {
                fields.emplace_back(); // Trailing empty field
            }
            return fields;
        }

        double parseDouble(const std::string& field, const char* column, std::size_t line_no) {
            try {
                std::size_t consumed = 0;
                double value = std::stod(field, &consumed);
                if (consumed != field.size()) {
                    throw std::invalid_argument("trailing characters");
                }
                return value;
            } catch (const std::exception&) {
                throw core::DataLoadException(fmt::format("Line {}: invalid {} value '{}'", line_no, column, field));
            }
        }

        // Integral values outside int saturate to INT_MIN/INT_MAX. Both are
        // malformed signals, so the simulator still treats them as no-ops.
        int parseSignal(const std::string& field, std::size_t line_no) {
            const double value = parseDouble(field, "signal", line_no);
            if (!std::isfinite(value) || std::trunc(value) != value) {
                throw core::DataLoadException(fmt::format("Line {}: signal '{}' is not an integer", line_no, field));
            }
            if (value < static_cast<double>(std::numeric_limits<int>::min())) {
                return std::numeric_limits<int>::min();
            }
            if (value > static_cast<double>(std::numeric_limits<int>::max())) {
                return std::numeric_limits<int>::max();
            }
            return static_cast<int>(value);
        }

        // Non-negative whole number of shares/contracts; never rounded into shape
        long long parseVolume(const std::string& field, std::size_t line_no) {
            const double value = parseDouble(field, "volume", line_no);
            if (!std::isfinite(value) || value < 0.0) {
                throw core::DataLoadException(fmt::format("Line {}: volume '{}' must be non-negative", line_no, field));
            }
            if (std::trunc(value) != value) {
                throw core::DataLoadException(fmt::format("Line {}: volume '{}' is not a whole number", line_no, field));
            }
            // 2^63 is exactly representable; anything at or above it does not fit
            if (value >= 9223372036854775808.0) {
                throw core::DataLoadException(fmt::format("Line {}: volume '{}' is out of range", line_no, field));
            }
            return static_cast<long long>(value);
        }

    } // namespace

    backtester::PriceSeries CsvLoader::loadFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::DataLoadException(fmt::format("Failed to open price file: {}", path));
        }
        return load(ifs, path);
    }

    backtester::PriceSeries CsvLoader::load(std::istream& input, const std::string& source_name) {
        auto logger = core::logging::getLogger();
        logger->info("Loading price series from {}", source_name);

        std::string line;
        std::size_t line_no = 0;
        std::map<std::string, std::size_t> columns;

        // --- Header ---
        while (std::getline(input, line)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (trim(line).empty()) continue;
            std::vector<std::string> names = splitLine(line);
            for (std::size_t i = 0; i < names.size(); ++i) {
                columns[toLower(names[i])] = i;
            }
            break;
        }
        if (columns.empty()) {
            throw core::DataLoadException(fmt::format("{}: missing header row", source_name));
        }
        for (const auto& required : kRequiredColumns) {
            if (columns.count(required) == 0) {
                throw core::DataLoadException(fmt::format("{}: header lacks required column '{}'", source_name, required));
            }
        }
        const bool has_sizes = columns.count(kSizeColumn) > 0;

        core::TimeSeries<core::Candle> bars;
        std::vector<int> signals;
        std::vector<std::optional<double>> size_hints;

        // --- Rows ---
        while (std::getline(input, line)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (trim(line).empty()) continue;

            std::vector<std::string> fields = splitLine(line);
            auto field = [&](const std::string& name) -> const std::string& {
                std::size_t idx = columns.at(name);
                if (idx >= fields.size()) {
                    throw core::DataLoadException(fmt::format("Line {}: missing '{}' field", line_no, name));
                }
                return fields[idx];
            };

            core::Candle candle;
            const std::string& date_field = field("date");
            try {
                candle.timestamp = core::utils::stringToTimestamp(date_field);
            } catch (const std::runtime_error& e) {
                throw core::DataLoadException(fmt::format("Line {}: {}", line_no, e.what()));
            }
            candle.open = parseDouble(field("open"), "open", line_no);
            candle.high = parseDouble(field("high"), "high", line_no);
            candle.low = parseDouble(field("low"), "low", line_no);
            candle.close = parseDouble(field("close"), "close", line_no);
            candle.volume = parseVolume(field("volume"), line_no);

            bars.push_back(candle);
            signals.push_back(parseSignal(field("signal"), line_no));

            if (has_sizes) {
                std::size_t idx = columns.at(kSizeColumn);
                if (idx < fields.size() && !fields[idx].empty()) {
                    size_hints.push_back(parseDouble(fields[idx], "position_size", line_no));
                } else {
                    size_hints.push_back(std::nullopt);
                }
            }
        }

        logger->info("Parsed {} rows from {}", bars.size(), source_name);
        return backtester::PriceSeries(std::move(bars), std::move(signals), std::move(size_hints));
    }

} // namespace data
