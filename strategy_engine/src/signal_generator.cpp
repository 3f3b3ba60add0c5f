#include "signal_generator.hpp"
#include "crossover_tracker.hpp"
#include "common_types.hpp"
#include "indicators.hpp"
#include "sma_indicator.hpp"
#include "ema_indicator.hpp"
#include "rsi_indicator.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>

namespace strategy_engine {

    namespace {

        core::SignalSeries makeHoldSeries(const core::PriceSeries& prices) {
            core::SignalSeries signals;
            signals.reserve(prices.size());
            for (const auto& bar : prices) {
                signals.push_back(core::Signal{bar.timestamp, core::SignalAction::Hold});
            }
            return signals;
        }

        // BUY when the short average crosses above the long one, SELL when it crosses below
        void applyCrossoverSignals(const core::PriceSeries& prices,
                                   indicators::IIndicator& short_line,
                                   indicators::IIndicator& long_line,
                                   core::SignalSeries& signals)
        {
            short_line.calculate(prices);
            long_line.calculate(prices);

            const size_t first_defined = static_cast<size_t>(std::max(short_line.getLookback(), long_line.getLookback()));
            CrossoverTracker tracker;

            for (size_t i = first_defined; i < prices.size(); ++i) {
                auto short_value = indicators::alignedValue(short_line, i);
                auto long_value = indicators::alignedValue(long_line, i);
                if (!short_value || !long_value) {
                    continue;
                }

                CrossType cross = tracker.update(*short_value, *long_value);
                signals[i].action = resolveSignal(cross == CrossType::CrossesAbove,
                                                  cross == CrossType::CrossesBelow);
            }
        }

        // BUY when RSI drops below oversold, SELL when it rises above overbought
        void applyRsiSignals(const core::PriceSeries& prices,
                             const RsiThresholdParams& params,
                             core::SignalSeries& signals)
        {
            indicators::RsiIndicator rsi(params.period);
            rsi.calculate(prices);

            CrossoverTracker oversold_tracker;
            CrossoverTracker overbought_tracker;

            for (size_t i = static_cast<size_t>(rsi.getLookback()); i < prices.size(); ++i) {
                auto value = indicators::alignedValue(rsi, i);
                if (!value) {
                    continue;
                }

                const bool buy = oversold_tracker.update(*value, params.oversold) == CrossType::CrossesBelow;
                const bool sell = overbought_tracker.update(*value, params.overbought) == CrossType::CrossesAbove;
                signals[i].action = resolveSignal(buy, sell);
            }
        }

        struct SignalVisitor {
            const core::PriceSeries& prices;
            core::SignalSeries& signals;

            void operator()(const SmaCrossoverParams& params) const {
                indicators::SmaIndicator short_sma(params.short_window);
                indicators::SmaIndicator long_sma(params.long_window);
                applyCrossoverSignals(prices, short_sma, long_sma, signals);
            }

            void operator()(const EmaCrossoverParams& params) const {
                indicators::EmaIndicator short_ema(params.short_window);
                indicators::EmaIndicator long_ema(params.long_window);
                applyCrossoverSignals(prices, short_ema, long_ema, signals);
            }

            void operator()(const RsiThresholdParams& params) const {
                applyRsiSignals(prices, params, signals);
            }
        };

    } // end anonymous namespace

    core::SignalSeries generateSignals(const core::PriceSeries& prices, const StrategyConfig& config) {
        auto logger = core::logging::getLogger();

        validate(config);
        core::utils::validatePriceSeries(prices);

        const std::string name = describe(config);
        core::SignalSeries signals = makeHoldSeries(prices);

        const int required = minimumBars(config);
        if (prices.size() < static_cast<size_t>(required)) {
            logger->debug("{}: {} bars available, {} needed for a first signal. All bars HOLD.",
                          name, prices.size(), required);
            return signals;
        }

        std::visit(SignalVisitor{prices, signals}, config);

        const auto buys = std::count_if(signals.begin(), signals.end(),
            [](const core::Signal& s) { return s.action == core::SignalAction::Buy; });
        const auto sells = std::count_if(signals.begin(), signals.end(),
            [](const core::Signal& s) { return s.action == core::SignalAction::Sell; });
        logger->debug("{}: generated {} signals over {} bars ({} BUY, {} SELL).",
                      name, signals.size(), prices.size(), buys, sells);

        if (logger->should_log(spdlog::level::trace)) {
            for (const auto& signal : signals) {
                if (signal.action != core::SignalAction::Hold) {
                    logger->trace("{} {} {}", name, core::utils::timestampToDate(signal.timestamp),
                                  core::utils::signalActionToString(signal.action));
                }
            }
        }
        return signals;
    }

} // namespace strategy_engine
