#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>
#include <memory>
#include <mutex>
#include <iostream>
#include <cstdlib>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <filesystem>   // C++17
#include <algorithm>
#include <cctype>
#include <optional>

namespace core {
namespace logging {

    namespace {

        std::shared_ptr<spdlog::logger> global_logger;
        std::mutex logger_mutex;

        const char* kLoggerName = "BacktestLogger";
        const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";
        const char* kLogDir = "logs";
        constexpr std::size_t kMaxLogFileBytes = 10 * 1024 * 1024;
        constexpr std::size_t kMaxLogFiles = 5;

        std::optional<spdlog::level::level_enum> levelFromEnv() {
            const char* env_level = std::getenv("SPDLOG_LEVEL");
            if (env_level == nullptr || *env_level == '\0') {
                return std::nullopt;
            }
            return level_from_string(env_level);
        }

        // logs/<base>_<YYYYMMDD_HHMMSS>Z.log, falling back to the working
        // directory when logs/ cannot be created
        std::string makeLogFilePath(const std::string& base_name) {
            std::string dir = kLogDir;
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                std::cerr << "[Logging] Cannot create '" << dir << "' (" << ec.message() << "), logging to ./" << std::endl;
                dir = ".";
            }

            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm{};
            #ifdef _WIN32
                gmtime_s(&utc_tm, &now);
            #else
                gmtime_r(&now, &utc_tm);
            #endif

            std::ostringstream oss;
            oss << dir << "/" << base_name << "_" << std::put_time(&utc_tm, "%Y%m%d_%H%M%SZ") << ".log";
            return oss.str();
        }

        void install(std::shared_ptr<spdlog::logger> logger) {
            std::lock_guard<std::mutex> lock(logger_mutex);
            spdlog::drop(kLoggerName);
            spdlog::register_logger(logger);
            spdlog::set_default_logger(logger);
            global_logger = std::move(logger);
        }

    } // namespace

    void initialize(const std::string& log_file_path,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level)
    {
        if (auto env_level = levelFromEnv()) {
            console_level = *env_level;
            file_level = *env_level;
        }

        try {
            const std::string file_path = makeLogFilePath(log_file_path);

            // Console goes to stderr; stdout carries the CLI's JSON result
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(console_level);
            console_sink->set_pattern(kPattern);

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file_path, kMaxLogFileBytes, kMaxLogFiles, true);
            file_sink->set_level(file_level);
            file_sink->set_pattern(kPattern);

            std::vector<spdlog::sink_ptr> sinks {console_sink, file_sink};
            auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            logger->set_level(std::min(console_level, file_level));
            logger->flush_on(spdlog::level::err);
            install(logger);

            logger->debug("Logging initialized. Console: {}, File: {} ({})",
                          spdlog::level::to_string_view(console_level),
                          spdlog::level::to_string_view(file_level),
                          file_path);

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        } catch (const std::exception& ex) {
            std::cerr << "Log initialization failed (std::exception): " << ex.what() << std::endl;
        }
    }

    std::shared_ptr<spdlog::logger> getLogger() {
        std::lock_guard<std::mutex> lock(logger_mutex);
        if (!global_logger) {
            // Library use without initialize(): quiet console logger
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_pattern(kPattern);
            global_logger = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
            global_logger->set_level(levelFromEnv().value_or(spdlog::level::warn));
        }
        return global_logger;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        std::string lower_str = level_str;
        std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (lower_str == "trace") return spdlog::level::trace;
        if (lower_str == "debug") return spdlog::level::debug;
        if (lower_str == "info") return spdlog::level::info;
        if (lower_str == "warn" || lower_str == "warning") return spdlog::level::warn;
        if (lower_str == "error" || lower_str == "err") return spdlog::level::err;
        if (lower_str == "critical" || lower_str == "crit") return spdlog::level::critical;
        if (lower_str == "off") return spdlog::level::off;
        std::cerr << "[Logging] Unrecognized log level '" << level_str << "', using 'info'." << std::endl;
        return spdlog::level::info;
    }

} // namespace logging
} // namespace core
