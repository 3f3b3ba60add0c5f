#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp> // Include JSON library header

#include "strategy_config.hpp"

namespace strategy_engine {

    using json = nlohmann::json; // Alias for convenience

    class StrategyFactory {
    public:
        // Builds and validates a strategy from e.g. {"type": "SMA", "short_window": 20, "long_window": 50}.
        // Missing parameters take the variant defaults. Throws core::ConfigurationException.
        static StrategyConfig createStrategy(const json& config);

        // Parses every element of a JSON array of strategy objects
        static std::vector<StrategyConfig> createStrategies(const json& configs);

        // Inverse of createStrategy, used in reports
        static json toJson(const StrategyConfig& config);

    private:
        static int parseWindow(const json& config, const char* key, int default_value);
        static double parseLevel(const json& config, const char* key, double default_value);
    };

} // namespace strategy_engine
