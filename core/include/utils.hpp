#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Format as ISO 8601 UTC, e.g. 2024-01-31T00:00:00Z
    std::string timestampToString(const Timestamp& ts);

    // Format the UTC calendar month, e.g. 2024-01
    std::string timestampToYearMonth(const Timestamp& ts);

    // Parse "YYYY-MM-DD" (midnight UTC) or "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]".
    // A date-time without zone designator is read as UTC.
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Whole calendar days from `from` to `to`, floored
    long long daysBetween(const Timestamp& from, const Timestamp& to);

    // Round half away from zero to `decimals` places
    double roundTo(double value, int decimals);

} // namespace utils
} // namespace core
