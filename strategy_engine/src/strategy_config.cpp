#include "strategy_config.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace strategy_engine {

    namespace {

        void validateWindows(const char* kind, int short_window, int long_window) {
            if (short_window <= 0 || long_window <= 0) {
                throw core::ConfigurationException(fmt::format(
                    "{} windows must be positive (short={}, long={}).", kind, short_window, long_window));
            }
            if (short_window >= long_window) {
                throw core::ConfigurationException(fmt::format(
                    "{} short_window ({}) must be less than long_window ({}).", kind, short_window, long_window));
            }
        }

        void validateParams(const SmaCrossoverParams& params) {
            validateWindows("SMA", params.short_window, params.long_window);
        }

        void validateParams(const EmaCrossoverParams& params) {
            validateWindows("EMA", params.short_window, params.long_window);
        }

        void validateParams(const RsiThresholdParams& params) {
            if (params.period <= 0) {
                throw core::ConfigurationException(fmt::format("RSI period must be positive, got {}.", params.period));
            }
            if (!std::isfinite(params.oversold) || params.oversold < 0.0 || params.oversold > 100.0) {
                throw core::ConfigurationException(fmt::format("RSI oversold must be within 0-100, got {}.", params.oversold));
            }
            if (!std::isfinite(params.overbought) || params.overbought < 0.0 || params.overbought > 100.0) {
                throw core::ConfigurationException(fmt::format("RSI overbought must be within 0-100, got {}.", params.overbought));
            }
            if (params.oversold >= params.overbought) {
                throw core::ConfigurationException(fmt::format(
                    "RSI oversold ({}) must be less than overbought ({}).", params.oversold, params.overbought));
            }
        }

        std::string describeParams(const SmaCrossoverParams& params) {
            return fmt::format("SMA({}/{})", params.short_window, params.long_window);
        }

        std::string describeParams(const EmaCrossoverParams& params) {
            return fmt::format("EMA({}/{})", params.short_window, params.long_window);
        }

        std::string describeParams(const RsiThresholdParams& params) {
            return fmt::format("RSI({}, {}/{})", params.period, params.oversold, params.overbought);
        }

        // Both averages defined from bar long_window - 1; a cross needs one more bar
        int minimumBarsFor(const SmaCrossoverParams& params) { return params.long_window + 1; }
        int minimumBarsFor(const EmaCrossoverParams& params) { return params.long_window + 1; }
        // RSI defined from bar `period`; a threshold cross needs one more bar
        int minimumBarsFor(const RsiThresholdParams& params) { return params.period + 2; }

    } // end anonymous namespace

    void validate(const StrategyConfig& config) {
        std::visit([](const auto& params) { validateParams(params); }, config);
    }

    std::string describe(const StrategyConfig& config) {
        return std::visit([](const auto& params) { return describeParams(params); }, config);
    }

    int minimumBars(const StrategyConfig& config) {
        return std::visit([](const auto& params) { return minimumBarsFor(params); }, config);
    }

} // namespace strategy_engine
