#pragma once

#include "datatypes.hpp"
#include <string>

namespace core {
namespace utils {

    // Parse "YYYY-MM-DD" into a Timestamp at 00:00 UTC. Throws std::invalid_argument.
    Timestamp dateToTimestamp(const std::string& date_string);

    // Format a Timestamp as "YYYY-MM-DD" (UTC calendar date)
    std::string timestampToDate(const Timestamp& ts);

    bool isValidDate(const std::string& date_string);

    std::string signalActionToString(SignalAction action);

    // Throws DataQualityException on non-finite or negative prices, negative volume,
    // or dates that are not strictly increasing.
    void validatePriceSeries(const PriceSeries& series);

} // namespace utils
} // namespace core
