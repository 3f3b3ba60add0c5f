#pragma once

#include "indicators.hpp" // Base interface
#include <vector>
#include <string>

namespace indicators {

class SmaIndicator : public IIndicator {
public:
    // Constructor: Requires the period for the SMA
    explicit SmaIndicator(int period);

    virtual ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::PriceSeries& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;          // SMA period (e.g., 20, 50)
    int lookback_;              // TA-Lib lookback (period - 1)
    std::string name_;          // Indicator name (e.g., "SMA(50)")
    core::TimeSeries<double> results_;
};

} // namespace indicators
