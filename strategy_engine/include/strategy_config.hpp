#pragma once

#include <string>
#include <variant>

namespace strategy_engine {

    struct SmaCrossoverParams {
        int short_window = 20;
        int long_window = 50;
    };

    struct EmaCrossoverParams {
        int short_window = 12;
        int long_window = 26;
    };

    struct RsiThresholdParams {
        int period = 14;
        double oversold = 30.0;
        double overbought = 70.0;
    };

    inline bool operator==(const SmaCrossoverParams& a, const SmaCrossoverParams& b) {
        return a.short_window == b.short_window && a.long_window == b.long_window;
    }

    inline bool operator==(const EmaCrossoverParams& a, const EmaCrossoverParams& b) {
        return a.short_window == b.short_window && a.long_window == b.long_window;
    }

    inline bool operator==(const RsiThresholdParams& a, const RsiThresholdParams& b) {
        return a.period == b.period && a.oversold == b.oversold && a.overbought == b.overbought;
    }

    // Closed set of strategy variants, dispatched with std::visit
    using StrategyConfig = std::variant<SmaCrossoverParams, EmaCrossoverParams, RsiThresholdParams>;

    // Throws core::ConfigurationException on invalid parameters
    void validate(const StrategyConfig& config);

    // Display name, e.g. "SMA(20/50)" or "RSI(14, 30/70)"
    std::string describe(const StrategyConfig& config);

    // Bars needed before the first bar that can carry a BUY or SELL
    int minimumBars(const StrategyConfig& config);

} // namespace strategy_engine
