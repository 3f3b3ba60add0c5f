#include "simulator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace backtester {

    void validate(const SimulationConfig& config) {
        if (!std::isfinite(config.initial_capital) || config.initial_capital <= 0.0) {
            throw core::ConfigurationException(
                fmt::format("initial_capital must be positive (got {}).", config.initial_capital));
        }
        if (!std::isfinite(config.commission_rate) || config.commission_rate < 0.0 || config.commission_rate >= 1.0) {
            throw core::ConfigurationException(
                fmt::format("commission_rate must be in [0, 1) (got {}).", config.commission_rate));
        }
    }

    SimulationResult simulate(const core::PriceSeries& prices,
                              const core::SignalSeries& signals,
                              const SimulationConfig& config)
    {
        auto logger = core::logging::getLogger();
        validate(config);

        if (prices.size() != signals.size()) {
            logger->error("Signal series has {} entries but price series has {}.", signals.size(), prices.size());
            throw core::AlignmentException(
                fmt::format("Signal/price length mismatch: {} signals for {} bars.", signals.size(), prices.size()));
        }

        Portfolio portfolio(config.initial_capital, config.commission_rate);

        for (size_t i = 0; i < prices.size(); ++i) {
            const core::PriceBar& bar = prices[i];
            const core::Signal& signal = signals[i];

            if (signal.timestamp != bar.timestamp) {
                logger->error("Signal at index {} is dated {} but the bar is dated {}.", i,
                              core::utils::timestampToDate(signal.timestamp),
                              core::utils::timestampToDate(bar.timestamp));
                throw core::AlignmentException(
                    fmt::format("Signal/price date mismatch at index {}.", i));
            }

            switch (signal.action) {
                case core::SignalAction::Buy:
                    portfolio.buy(bar.timestamp, bar.close);
                    break;
                case core::SignalAction::Sell:
                    portfolio.sell(bar.timestamp, bar.close);
                    break;
                case core::SignalAction::Hold:
                    break;
            }

            portfolio.recordTimestampValue(bar.timestamp, bar.close);
            logger->trace("{} close={:.4f} equity={:.2f}", core::utils::timestampToDate(bar.timestamp),
                          bar.close, portfolio.getEquityCurve().back().total_value);
        }

        SimulationResult result = portfolio.release();
        if (result.open_position) {
            logger->debug("Position of {} shares left open at series end.", result.open_position->shares);
        }
        logger->debug("Simulation done: {} bars, {} trades, final cash {:.2f}.",
                      prices.size(), result.trades.size(), result.final_cash);
        return result;
    }

} // namespace backtester
