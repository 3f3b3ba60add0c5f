#include <gtest/gtest.h>

#include <vector>

#include "backtester.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using test_helpers::makeSeries;

namespace {

    backtester::SimulationConfig defaultConfig(double capital = 1000.0) {
        backtester::SimulationConfig config;
        config.initial_capital = capital;
        return config;
    }

} // namespace

TEST(BacktesterTest, RunsSignalsSimulationAndMetrics) {
    const auto prices = makeSeries({10, 10, 10, 12, 12, 12, 8, 8, 8, 8}, "2024-03-01");
    backtester::Backtester engine(defaultConfig());

    const auto result = engine.run("STEP", prices, strategy_engine::SmaCrossoverParams{2, 3});
    EXPECT_EQ(result.symbol, "STEP");
    EXPECT_EQ(result.strategy_name, "SMA(2/3)");
    EXPECT_EQ(result.start_date, "2024-03-01");
    EXPECT_EQ(result.end_date, "2024-03-10");
    EXPECT_EQ(result.signals.size(), prices.size());
    EXPECT_EQ(result.simulation.trades.size(), 1u);
    EXPECT_EQ(result.metrics.num_trades, 1);
    EXPECT_DOUBLE_EQ(result.metrics.final_equity, 668.0);
    EXPECT_NEAR(result.metrics.total_return_pct, -33.2, 1e-9);
    EXPECT_DOUBLE_EQ(result.metrics.win_rate_pct, 0.0);
    EXPECT_DOUBLE_EQ(result.buy_hold_return_pct, -20.0);
}

TEST(BacktesterTest, FlatSeriesProducesNoTrades) {
    const auto prices = makeSeries(std::vector<double>(20, 50.0));
    backtester::Backtester engine(defaultConfig());
    for (const strategy_engine::StrategyConfig& config :
         {strategy_engine::StrategyConfig{strategy_engine::SmaCrossoverParams{2, 5}},
          strategy_engine::StrategyConfig{strategy_engine::EmaCrossoverParams{2, 5}},
          strategy_engine::StrategyConfig{strategy_engine::RsiThresholdParams{3, 30.0, 70.0}}}) {
        const auto result = engine.run("FLAT", prices, config);
        EXPECT_EQ(result.metrics.num_trades, 0);
        EXPECT_DOUBLE_EQ(result.metrics.total_return_pct, 0.0);
        EXPECT_DOUBLE_EQ(result.metrics.sharpe_ratio, 0.0);
        EXPECT_DOUBLE_EQ(result.metrics.max_drawdown_pct, 0.0);
    }
}

TEST(BacktesterTest, RepeatedRunsAreIdentical) {
    const auto prices = makeSeries({10, 11, 9, 12, 14, 13, 9, 8, 11, 15, 16, 12, 10, 9, 13});
    backtester::Backtester engine(defaultConfig());
    const strategy_engine::StrategyConfig config = strategy_engine::EmaCrossoverParams{2, 4};

    const auto first = engine.run("X", prices, config);
    const auto second = engine.run("X", prices, config);
    ASSERT_EQ(first.simulation.equity_curve.size(), second.simulation.equity_curve.size());
    for (size_t i = 0; i < first.simulation.equity_curve.size(); ++i) {
        EXPECT_EQ(first.simulation.equity_curve[i].total_value, second.simulation.equity_curve[i].total_value);
    }
    EXPECT_EQ(first.metrics.toMap(), second.metrics.toMap());
}

TEST(BacktesterTest, RejectsInvalidCapital) {
    const auto config = defaultConfig(0.0);
    EXPECT_THROW({ backtester::Backtester engine(config); }, core::ConfigurationException);
}

TEST(BacktesterTest, PropagatesDataQualityErrors) {
    auto prices = makeSeries({10, 11, 12, 13});
    prices[1].close = -2.0;
    backtester::Backtester engine(defaultConfig());
    EXPECT_THROW(engine.run("BAD", prices, strategy_engine::SmaCrossoverParams{2, 3}), core::DataQualityException);
}
