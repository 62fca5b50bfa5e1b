#include "utils.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For string streams
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cmath>      // For std::pow, std::round
#include <cctype>     // For std::isdigit
#include <chrono>
#include <ctime>

namespace core {
namespace utils {

    namespace {

        std::tm toUtcTm(const Timestamp& ts) {
            auto tt = std::chrono::system_clock::to_time_t(ts);
            std::tm time_tm{};
            #ifdef _WIN32
                gmtime_s(&time_tm, &tt);
            #else
                gmtime_r(&tt, &time_tm);
            #endif
            return time_tm;
        }

        std::string formatUtc(const Timestamp& ts, const char* format) {
            std::tm time_tm = toUtcTm(ts);
            std::ostringstream oss;
            oss << std::put_time(&time_tm, format);
            return oss.str();
        }

    } // namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Date part is mandatory
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date part): " + iso_string);
        }

        double fractional_seconds = 0.0;
        std::chrono::seconds offset_duration = std::chrono::seconds(0);

        // 2. Optional time part
        if (ss.peek() == 'T' || ss.peek() == ' ') {
            ss.ignore();
            ss >> std::get_time(&tm, "%H:%M:%S");
            if (ss.fail()) {
                throw std::runtime_error("Failed to parse timestamp (time part): " + iso_string);
            }

            // 3. Optional fractional seconds
            if (ss.peek() == '.') {
                ss.ignore(); // consume '.'
                std::string digits;
                int digit_count = 0;
                while (std::isdigit(ss.peek()) && digit_count < 9) { // Nanosecond precision at most
                    digits += static_cast<char>(ss.get());
                    digit_count++;
                }
                while (std::isdigit(ss.peek())) {
                    ss.ignore();
                }
                if (!digits.empty()) {
                    fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
                }
            }

            // 4. Optional timezone designator (Z, +HH:MM, -HH:MM); absent means UTC
            char sign_or_z = 0;
            if (ss >> sign_or_z) {
                if (sign_or_z == 'Z') {
                    offset_duration = std::chrono::seconds(0);
                } else if (sign_or_z == '+' || sign_or_z == '-') {
                    int offset_h = 0;
                    int offset_m = 0;
                    char colon = ' ';
                    if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                        throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                    }
                    offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                    if (sign_or_z == '-') {
                        offset_duration *= -1;
                    }
                } else {
                    throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
                }
            }
        }

        // Anything left over is garbage
        std::string rest;
        if (ss >> rest) {
            throw std::runtime_error("Unexpected trailing characters in timestamp: " + iso_string);
        }

        // timegm interprets struct tm as UTC. Use _mkgmtime on Windows.
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == static_cast<time_t>(-1)) {
             throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::duration<double>(fractional_seconds));

        // 2015-04-20T00:00:00+05:30 is 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        return formatUtc(ts, "%Y-%m-%dT%H:%M:%SZ");
    }

    std::string timestampToYearMonth(const Timestamp& ts) {
        return formatUtc(ts, "%Y-%m");
    }

    long long daysBetween(const Timestamp& from, const Timestamp& to) {
        constexpr long long kSecondsPerDay = 24 * 60 * 60;
        long long secs = std::chrono::floor<std::chrono::seconds>(to - from).count();
        long long days = secs / kSecondsPerDay;
        if (secs % kSecondsPerDay < 0) {
            --days; // floor for negative spans
        }
        return days;
    }

    double roundTo(double value, int decimals) {
        const double scale = std::pow(10.0, decimals);
        return std::round(value * scale) / scale;
    }

} // namespace utils
} // namespace core
