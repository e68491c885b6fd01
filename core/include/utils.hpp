#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Timestamp -> ISO 8601 UTC string, e.g. "2023-01-02T00:00:00Z"
    std::string timestampToString(const Timestamp& ts);

    // Parse "YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)" or a bare "YYYY-MM-DD" (midnight UTC)
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Fractional days in a duration (negative durations stay negative)
    double durationToDays(const Duration& d);

    std::string toString(OrderSide side);
    std::string toString(OrderType type);
    std::string toString(OrderStatus status);

} // namespace utils
} // namespace core
