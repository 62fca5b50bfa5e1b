#include "backtest_config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>

namespace backtester {

    namespace {

        const std::set<std::string> kKnownKeys = {
            "starting_capital", "position_size_fraction", "price_rounding_decimals",
            "commission_rate", "start_date", "end_date", "log_level"
        };

        double readNumber(const json& config, const char* key, double fallback) {
            if (!config.contains(key)) return fallback;
            const auto& value = config[key];
            if (!value.is_number()) {
                throw core::ConfigException(fmt::format("Config key '{}' must be a number.", key));
            }
            return value.get<double>();
        }

        std::optional<core::Timestamp> readDate(const json& config, const char* key) {
            if (!config.contains(key) || config[key].is_null()) return std::nullopt;
            const auto& value = config[key];
            if (!value.is_string()) {
                throw core::ConfigException(fmt::format("Config key '{}' must be a date string.", key));
            }
            try {
                return core::utils::stringToTimestamp(value.get<std::string>());
            } catch (const std::runtime_error& e) {
                throw core::ConfigException(fmt::format("Config key '{}': {}", key, e.what()));
            }
        }

    } // namespace

    void BacktestConfig::validate() const {
        if (!std::isfinite(starting_capital) || starting_capital <= 0.0) {
            throw core::ConfigException(fmt::format("starting_capital must be positive, got {}", starting_capital));
        }
        if (!std::isfinite(position_size_fraction) || position_size_fraction <= 0.0 || position_size_fraction > 1.0) {
            throw core::ConfigException(fmt::format("position_size_fraction must be in (0, 1], got {}", position_size_fraction));
        }
        if (price_rounding_decimals < 0 || price_rounding_decimals > 8) {
            throw core::ConfigException(fmt::format("price_rounding_decimals must be in [0, 8], got {}", price_rounding_decimals));
        }
        if (!std::isfinite(commission_rate) || commission_rate < 0.0 || commission_rate >= 0.1) {
            throw core::ConfigException(fmt::format("commission_rate must be in [0, 0.1), got {}", commission_rate));
        }
        if (start_date && end_date && *start_date > *end_date) {
            throw core::ConfigException("start_date must not be after end_date.");
        }
    }

    BacktestConfig loadConfigFromJson(const json& config) {
        if (!config.is_object()) {
            throw core::ConfigException("Backtest config must be a JSON object.");
        }
        auto logger = core::logging::getLogger();
        for (const auto& item : config.items()) {
            if (kKnownKeys.count(item.key()) == 0) {
                logger->warn("Ignoring unknown config key '{}'", item.key());
            }
        }

        BacktestConfig result;
        result.starting_capital = readNumber(config, "starting_capital", result.starting_capital);
        result.position_size_fraction = readNumber(config, "position_size_fraction", result.position_size_fraction);
        result.commission_rate = readNumber(config, "commission_rate", result.commission_rate);
        if (config.contains("price_rounding_decimals")) {
            if (!config["price_rounding_decimals"].is_number_integer()) {
                throw core::ConfigException("Config key 'price_rounding_decimals' must be an integer.");
            }
            const json& decimals = config["price_rounding_decimals"];
            // Unsigned values above int64_t max would wrap on get<int64_t>()
            const bool too_large = decimals.is_number_unsigned()
                && decimals.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max());
            const std::int64_t value = too_large ? std::numeric_limits<std::int64_t>::max() : decimals.get<std::int64_t>();
            if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
                throw core::ConfigException(fmt::format("price_rounding_decimals must be in [0, 8], got {}", decimals.dump()));
            }
            result.price_rounding_decimals = static_cast<int>(value);
        }
        result.start_date = readDate(config, "start_date");
        result.end_date = readDate(config, "end_date");

        result.validate();
        logger->debug("Backtest config loaded: {}", toJson(result).dump());
        return result;
    }

    json readConfigJson(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::ConfigException(fmt::format("Failed to open config file: {}", path));
        }
        json config;
        try {
            config = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw core::ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }
        return config;
    }

    BacktestConfig loadConfigFromFile(const std::string& path) {
        return loadConfigFromJson(readConfigJson(path));
    }

    json toJson(const BacktestConfig& config) {
        json j = {
            {"starting_capital", config.starting_capital},
            {"position_size_fraction", config.position_size_fraction},
            {"price_rounding_decimals", config.price_rounding_decimals},
            {"commission_rate", config.commission_rate}
        };
        j["start_date"] = config.start_date ? json(core::utils::timestampToString(*config.start_date)) : json(nullptr);
        j["end_date"] = config.end_date ? json(core::utils::timestampToString(*config.end_date)) : json(nullptr);
        return j;
    }

} // namespace backtester
