// cli/src/main.cpp

#include <iostream>
#include <string>
#include <exception>
#include <fstream>
#include <memory>

#include "logging.hpp"
#include "exceptions.hpp"
#include "backtest_config.hpp"
#include "backtester.hpp"
#include "csv_loader.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <nlohmann/json.hpp>

namespace {

    void printUsage(const char* program) {
        std::cerr << "Usage: " << program << " <config.json> <prices.csv> [output.json]" << std::endl;
    }

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 4) {
        printUsage(argv[0]);
        return 2;
    }
    const std::string config_path = argv[1];
    const std::string prices_path = argv[2];
    const std::string output_path = (argc == 4) ? argv[3] : "";

    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        // --- Config first, it may carry the log level ---
        nlohmann::json config_json = backtester::readConfigJson(config_path);
        spdlog::level::level_enum console_level = spdlog::level::info;
        if (config_json.contains("log_level") && config_json["log_level"].is_string()) {
            console_level = core::logging::level_from_string(config_json["log_level"].get<std::string>());
        }

        // --- Initialize Logging ---
        core::logging::initialize("backtest_cli", console_level, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Backtest CLI starting...");

        backtester::BacktestConfig config = backtester::loadConfigFromJson(config_json);
        logger->info("Backtest Parameters: Capital={:.2f}, SizeFraction={}, Commission={}",
                     config.starting_capital, config.position_size_fraction, config.commission_rate);

        // --- Load Data ---
        backtester::PriceSeries series = data::CsvLoader::loadFile(prices_path);

        // --- Run ---
        backtester::Backtester the_backtester(config);
        backtester::BacktestResult result = the_backtester.run(series);

        // --- Emit ---
        const std::string rendered = backtester::toJson(result).dump(2);
        if (output_path.empty()) {
            std::cout << rendered << std::endl;
        } else {
            std::ofstream ofs(output_path);
            if (!ofs.is_open()) {
                throw core::BacktestException(fmt::format("Failed to open output file: {}", output_path));
            }
            ofs << rendered << '\n';
            if (!ofs) {
                throw core::BacktestException(fmt::format("Failed to write output file: {}", output_path));
            }
            logger->info("Result written to {}", output_path);
        }

        logger->info("Backtest CLI finished.");

    // --- Exception Handling ---
    } catch (const core::BacktestEngineException& ex) {
        std::cerr << "Backtest Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Backtest Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
