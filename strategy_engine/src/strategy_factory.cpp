#include "strategy_factory.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace strategy_engine {

    namespace { // Use anonymous namespace for file-local helpers

        std::string toUpper(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return value;
        }

        struct ToJsonVisitor {
            json operator()(const SmaCrossoverParams& params) const {
                return json{{"type", "SMA"}, {"short_window", params.short_window}, {"long_window", params.long_window}};
            }
            json operator()(const EmaCrossoverParams& params) const {
                return json{{"type", "EMA"}, {"short_window", params.short_window}, {"long_window", params.long_window}};
            }
            json operator()(const RsiThresholdParams& params) const {
                return json{{"type", "RSI"}, {"period", params.period},
                            {"oversold", params.oversold}, {"overbought", params.overbought}};
            }
        };

    } // end anonymous namespace

    int StrategyFactory::parseWindow(const json& config, const char* key, int default_value) {
        if (!config.contains(key)) {
            return default_value;
        }
        const json& value = config[key];
        if (!value.is_number_integer()) {
            throw core::ConfigurationException(fmt::format("Strategy parameter '{}' must be an integer.", key));
        }
        // Range-check before narrowing so 2^32 + 50 is not read as 50
        const bool in_range = value.is_number_unsigned()
            ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : value.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
              value.get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!in_range) {
            throw core::ConfigurationException(
                fmt::format("Strategy parameter '{}' is out of range: {}", key, value.dump()));
        }
        return static_cast<int>(value.get<std::int64_t>());
    }

    double StrategyFactory::parseLevel(const json& config, const char* key, double default_value) {
        if (!config.contains(key)) {
            return default_value;
        }
        const json& value = config[key];
        if (!value.is_number()) {
            throw core::ConfigurationException(fmt::format("Strategy parameter '{}' must be a number.", key));
        }
        return value.get<double>();
    }

    StrategyConfig StrategyFactory::createStrategy(const json& config) {
        auto logger = core::logging::getLogger();

        if (!config.is_object() || !config.contains("type") || !config["type"].is_string()) {
            logger->error("Invalid strategy configuration: {}", config.dump());
            throw core::ConfigurationException("Strategy config must be an object with a 'type' (string).");
        }

        const std::string type = toUpper(config["type"].get<std::string>());
        StrategyConfig strategy;

        if (type == "SMA") {
            SmaCrossoverParams params;
            params.short_window = parseWindow(config, "short_window", params.short_window);
            params.long_window = parseWindow(config, "long_window", params.long_window);
            strategy = params;
        } else if (type == "EMA") {
            EmaCrossoverParams params;
            params.short_window = parseWindow(config, "short_window", params.short_window);
            params.long_window = parseWindow(config, "long_window", params.long_window);
            strategy = params;
        } else if (type == "RSI") {
            RsiThresholdParams params;
            params.period = parseWindow(config, "period", params.period);
            params.oversold = parseLevel(config, "oversold", params.oversold);
            params.overbought = parseLevel(config, "overbought", params.overbought);
            strategy = params;
        } else {
            logger->error("Unknown strategy type '{}' in config.", type);
            throw core::ConfigurationException(fmt::format("Unknown strategy type '{}' (expected SMA, EMA or RSI).", type));
        }

        try {
            validate(strategy);
        } catch (const core::ConfigurationException& e) {
            logger->error("Invalid strategy configuration: {}", e.what());
            throw;
        }

        logger->debug("Created strategy {}", describe(strategy));
        return strategy;
    }

    std::vector<StrategyConfig> StrategyFactory::createStrategies(const json& configs) {
        if (!configs.is_array()) {
            throw core::ConfigurationException("Strategy list must be a JSON array.");
        }
        auto logger = core::logging::getLogger();
        std::vector<StrategyConfig> strategies;
        strategies.reserve(configs.size());
        for (const auto& config : configs) {
            StrategyConfig strategy = createStrategy(config);
            // Identical entries would repeat the same run; keep the first
            if (std::find(strategies.begin(), strategies.end(), strategy) != strategies.end()) {
                logger->warn("Ignoring duplicate strategy {}.", describe(strategy));
                continue;
            }
            strategies.push_back(std::move(strategy));
        }
        return strategies;
    }

    json StrategyFactory::toJson(const StrategyConfig& config) {
        return std::visit(ToJsonVisitor{}, config);
    }

} // namespace strategy_engine
