#include "rsi_indicator.hpp"
#include "logging.hpp"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RsiIndicator::RsiIndicator(int period) : period_(period), lookback_(period) {
    if (period_ <= 0) {
         throw std::invalid_argument("RSI period must be positive.");
    }

    name_ = fmt::format("RSI({})", period_);
    core::logging::getLogger()->debug("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RsiIndicator::getResult() const {
    return results_;
}

double RsiIndicator::fromAverages(double avg_gain, double avg_loss) {
    if (avg_loss == 0.0) {
        return 100.0;
    }
    return 100.0 - 100.0 / (1.0 + avg_gain / avg_loss);
}

// TA_RSI zeroes its output once gain + loss drops inside its zero tolerance,
// which turns a long flat stretch or a sub-1e-8 price scale into a false 0.
// The recurrence is run here so only an exactly zero average loss reads 100.
void RsiIndicator::calculate(const core::PriceSeries& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    const std::vector<double> close_prices = closePrices(input);
    const size_t period = static_cast<size_t>(period_);
    results_.reserve(close_prices.size() - period);

    // --- Seed: simple mean of the first `period` changes ---
    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (size_t i = 1; i <= period; ++i) {
        const double change = close_prices[i] - close_prices[i - 1];
        if (change > 0.0) {
            avg_gain += change;
        } else {
            avg_loss -= change;
        }
    }
    avg_gain /= period_;
    avg_loss /= period_;
    results_.push_back(fromAverages(avg_gain, avg_loss));

    // --- Wilder smoothing ---
    for (size_t i = period + 1; i < close_prices.size(); ++i) {
        const double change = close_prices[i] - close_prices[i - 1];
        const double gain = change > 0.0 ? change : 0.0;
        const double loss = change < 0.0 ? -change : 0.0;
        avg_gain = (avg_gain * (period_ - 1) + gain) / period_;
        avg_loss = (avg_loss * (period_ - 1) + loss) / period_;
        results_.push_back(fromAverages(avg_gain, avg_loss));
    }

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
