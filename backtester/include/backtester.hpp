#pragma once

#include <string>

// Required project headers (use short paths)
#include "datatypes.hpp"
#include "strategy_config.hpp" // Strategy variants
#include "portfolio.hpp"       // SimulationConfig, SimulationResult
#include "metrics.hpp"         // BacktestMetrics

namespace backtester {

    // Everything one (symbol, strategy) run produces
    struct BacktestResult {
        std::string symbol;
        std::string strategy_name;      // describe(strategy)
        std::string start_date;         // First bar, YYYY-MM-DD; empty for an empty series
        std::string end_date;
        core::SignalSeries signals;
        SimulationResult simulation;
        BacktestMetrics metrics;
        double buy_hold_return_pct = 0.0;
    };

    class Backtester {
    public:
        // Throws core::ConfigurationException for invalid capital/commission
        explicit Backtester(SimulationConfig config);

        // Signals -> simulation -> metrics for one series. Holds no state between
        // calls, so one instance may serve concurrent runs.
        BacktestResult run(const std::string& symbol,
                           const core::PriceSeries& prices,
                           const strategy_engine::StrategyConfig& strategy) const;

        const SimulationConfig& getConfig() const { return config_; }

    private:
        SimulationConfig config_;
    };

} // namespace backtester
