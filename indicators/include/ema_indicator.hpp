#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Exponential moving average, k = 2 / (period + 1), seeded with the simple
// average of the first `period` closes.
class EmaIndicator : public IIndicator {
public:
    explicit EmaIndicator(int period);

    virtual ~EmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::PriceSeries& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
