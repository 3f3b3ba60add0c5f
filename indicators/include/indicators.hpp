#pragma once

#include "datatypes.hpp" // Needs PriceSeries, TimeSeries
#include <string>
#include <vector>
#include <optional>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "SMA(20)", "RSI(14)")
    virtual std::string getName() const = 0;

    // Number of leading input bars consumed before the first valid output.
    // Output element j belongs to input bar j + getLookback().
    virtual int getLookback() const = 0;

    // Calculate the indicator over the close prices of the input series.
    // Inputs no longer than the lookback produce an empty result.
    virtual void calculate(const core::PriceSeries& input) = 0;

    // Results, shorter than the input by the lookback
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

// Indicator value aligned to input bar `input_index`, or nullopt while still inside the lookback
inline std::optional<double> alignedValue(const IIndicator& indicator, size_t input_index) {
    const auto lookback = static_cast<size_t>(indicator.getLookback());
    if (input_index < lookback) {
        return std::nullopt;
    }
    const auto& results = indicator.getResult();
    const size_t result_index = input_index - lookback;
    if (result_index >= results.size()) {
        return std::nullopt;
    }
    return results[result_index];
}

// Close prices in input order, the only field the indicators read
inline std::vector<double> closePrices(const core::PriceSeries& input) {
    std::vector<double> close_prices;
    close_prices.reserve(input.size());
    for (const auto& bar : input) {
        close_prices.push_back(bar.close);
    }
    return close_prices;
}

} // namespace indicators
