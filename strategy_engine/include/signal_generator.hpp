#pragma once

#include "datatypes.hpp"
#include "strategy_config.hpp"

namespace strategy_engine {

    // Maps a price series to one signal per bar, dated like the bar it belongs to.
    // The signal for bar i is computed from bars 0..i only. Series shorter than
    // the strategy's lookback produce HOLD throughout.
    //
    // Throws core::DataQualityException for non-finite/negative prices or
    // non-increasing dates, core::ConfigurationException for invalid parameters.
    core::SignalSeries generateSignals(const core::PriceSeries& prices, const StrategyConfig& config);

} // namespace strategy_engine
