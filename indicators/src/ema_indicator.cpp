#include "ema_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace indicators {

EmaIndicator::EmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
         throw std::invalid_argument("EMA period must be positive.");
    }

    // TA_EMA accepts periods from 2; a 1-bar EMA (k = 1) is the close itself
    if (period_ > 1) {
        lookback_ = TA_EMA_Lookback(period_);
        if (lookback_ < 0) {
             throw core::IndicatorCalculationException(fmt::format("TA_EMA_Lookback returned an unexpected value: {}", lookback_));
        }
    }

    name_ = fmt::format("EMA({})", period_);
    core::logging::getLogger()->debug("EmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string EmaIndicator::getName() const {
    return name_;
}

int EmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& EmaIndicator::getResult() const {
    return results_;
}

void EmaIndicator::calculate(const core::PriceSeries& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> close_prices = closePrices(input);

    if (period_ == 1) {
        results_ = std::move(close_prices);
        return;
    }

    const int output_size = static_cast<int>(close_prices.size()) - lookback_;
    results_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_EMA(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_EMA failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_ || out_nb_element != output_size) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_EMA output misaligned for {}: begin {} (expected {}), count {} (expected {})",
                        name_, out_begin_idx, lookback_, out_nb_element, output_size));
    }

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
