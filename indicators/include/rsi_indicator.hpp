#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Wilder RSI. Reads 100 while the smoothed average loss is exactly zero.
class RsiIndicator : public IIndicator {
public:
    // Constructor: Requires the period for the RSI
    explicit RsiIndicator(int period);

    virtual ~RsiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::PriceSeries& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    static double fromAverages(double avg_gain, double avg_loss);

    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
