#pragma once

#include "datatypes.hpp"
#include "portfolio.hpp" // SimulationConfig, SimulationResult

namespace backtester {

    // Throws core::ConfigurationException for non-positive capital or a rate outside [0, 1)
    void validate(const SimulationConfig& config);

    // Replays signals bar by bar through a fresh Portfolio, one equity point per bar.
    // Throws core::AlignmentException when lengths or dates differ.
    SimulationResult simulate(const core::PriceSeries& prices,
                              const core::SignalSeries& signals,
                              const SimulationConfig& config);

} // namespace backtester
