#include "utils.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <iomanip> // For std::put_time, std::get_time
#include <sstream> // For string streams
#include <string>
#include <stdexcept>
#include <cmath>   // For std::isfinite
#include <ctime>

namespace core {
namespace utils {

    // Dates are kept as UTC midnight so that every bar of a daily series
    // formats back to the same calendar date regardless of the host time zone.
    Timestamp dateToTimestamp(const std::string& date_string) {
        if (date_string.size() != 10 || date_string[4] != '-' || date_string[7] != '-') {
            throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): " + date_string);
        }

        std::tm tm = {};
        std::istringstream ss(date_string);
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::invalid_argument("Failed to parse date: " + date_string);
        }
        const int parsed_month = tm.tm_mon;
        const int parsed_day = tm.tm_mday;

        // timegm interprets struct tm as UTC. Use _mkgmtime on Windows.
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == (time_t)-1) {
             throw std::invalid_argument("Failed to convert date to UTC epoch seconds: " + date_string);
        }
        // timegm normalizes out-of-range fields (2023-02-30 -> 2023-03-02)
        if (tm.tm_mon != parsed_month || tm.tm_mday != parsed_day) {
            throw std::invalid_argument("Date does not exist in the calendar: " + date_string);
        }

        return std::chrono::system_clock::from_time_t(tt);
    }

    std::string timestampToDate(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);

        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

    bool isValidDate(const std::string& date_string) {
        try {
            dateToTimestamp(date_string);
            return true;
        } catch (const std::invalid_argument&) {
            return false;
        }
    }

    std::string signalActionToString(SignalAction action) {
        switch (action) {
            case SignalAction::Hold: return "HOLD";
            case SignalAction::Buy:  return "BUY";
            case SignalAction::Sell: return "SELL";
        }
        return "UNKNOWN";
    }

    void validatePriceSeries(const PriceSeries& series) {
        for (size_t i = 0; i < series.size(); ++i) {
            const PriceBar& bar = series[i];
            const double prices[] = {bar.open, bar.high, bar.low, bar.close};
            for (double price : prices) {
                if (!std::isfinite(price)) {
                    throw DataQualityException(fmt::format(
                        "Non-finite price at index {} ({})", i, timestampToDate(bar.timestamp)));
                }
                if (price < 0.0) {
                    throw DataQualityException(fmt::format(
                        "Negative price {} at index {} ({})", price, i, timestampToDate(bar.timestamp)));
                }
            }
            if (bar.volume < 0) {
                throw DataQualityException(fmt::format(
                    "Negative volume {} at index {} ({})", bar.volume, i, timestampToDate(bar.timestamp)));
            }
            if (i > 0 && !(series[i - 1].timestamp < bar.timestamp)) {
                throw DataQualityException(fmt::format(
                    "Dates not strictly increasing at index {}: {} follows {}",
                    i, timestampToDate(bar.timestamp), timestampToDate(series[i - 1].timestamp)));
            }
        }
    }

} // namespace utils
} // namespace core
