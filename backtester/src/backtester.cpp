#include "backtester.hpp"
#include "signal_generator.hpp"
#include "simulator.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace backtester {

    Backtester::Backtester(SimulationConfig config)
        : config_(config)
    {
        validate(config_);
        core::logging::getLogger()->debug("Backtester initialized with capital: {}, commission rate: {}",
                                          config_.initial_capital, config_.commission_rate);
    }

    BacktestResult Backtester::run(const std::string& symbol,
                                   const core::PriceSeries& prices,
                                   const strategy_engine::StrategyConfig& strategy) const
    {
        auto logger = core::logging::getLogger();

        BacktestResult result;
        result.symbol = symbol;
        result.strategy_name = strategy_engine::describe(strategy);
        if (!prices.empty()) {
            result.start_date = core::utils::timestampToDate(prices.front().timestamp);
            result.end_date = core::utils::timestampToDate(prices.back().timestamp);
        }

        logger->info("Starting backtest {} / {} over {} bars ({} to {})", symbol, result.strategy_name,
                     prices.size(), result.start_date, result.end_date);

        // 1. Signals (validates strategy and series)
        result.signals = strategy_engine::generateSignals(prices, strategy);

        // 2. Replay
        result.simulation = simulate(prices, result.signals, config_);

        // 3. Metrics
        result.metrics = calculateMetrics(result.simulation.equity_curve,
                                          result.simulation.trades,
                                          config_.initial_capital);
        result.buy_hold_return_pct = computeBuyAndHoldReturnPct(prices);

        logger->info("Backtest {} / {} completed: return {:.2f}% (buy & hold {:.2f}%), {} trades",
                     symbol, result.strategy_name, result.metrics.total_return_pct,
                     result.buy_hold_return_pct, result.metrics.num_trades);
        return result;
    }

} // namespace backtester
