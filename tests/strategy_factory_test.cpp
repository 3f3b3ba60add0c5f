#include <gtest/gtest.h>

#include <variant>

#include "strategy_factory.hpp"
#include "exceptions.hpp"

using strategy_engine::StrategyFactory;
using strategy_engine::json;

TEST(StrategyFactoryTest, AppliesDefaults) {
    auto sma = StrategyFactory::createStrategy(json{{"type", "SMA"}});
    ASSERT_TRUE(std::holds_alternative<strategy_engine::SmaCrossoverParams>(sma));
    EXPECT_EQ(std::get<strategy_engine::SmaCrossoverParams>(sma).short_window, 20);
    EXPECT_EQ(std::get<strategy_engine::SmaCrossoverParams>(sma).long_window, 50);

    EXPECT_EQ(strategy_engine::describe(StrategyFactory::createStrategy(json{{"type", "EMA"}})), "EMA(12/26)");
    EXPECT_EQ(strategy_engine::describe(StrategyFactory::createStrategy(json{{"type", "RSI"}})), "RSI(14, 30/70)");
}

TEST(StrategyFactoryTest, ReadsParametersCaseInsensitively) {
    auto config = StrategyFactory::createStrategy(
        json{{"type", "rsi"}, {"period", 7}, {"oversold", 25.5}, {"overbought", 80}});
    ASSERT_TRUE(std::holds_alternative<strategy_engine::RsiThresholdParams>(config));
    const auto& params = std::get<strategy_engine::RsiThresholdParams>(config);
    EXPECT_EQ(params.period, 7);
    EXPECT_DOUBLE_EQ(params.oversold, 25.5);
    EXPECT_DOUBLE_EQ(params.overbought, 80.0);
}

TEST(StrategyFactoryTest, RejectsInvalidConfigs) {
    EXPECT_THROW(StrategyFactory::createStrategy(json::array()), core::ConfigurationException);
    EXPECT_THROW(StrategyFactory::createStrategy(json{{"kind", "SMA"}}), core::ConfigurationException);
    EXPECT_THROW(StrategyFactory::createStrategy(json{{"type", "MACD"}}), core::ConfigurationException);
    EXPECT_THROW(StrategyFactory::createStrategy(json{{"type", "SMA"}, {"short_window", 2.5}}),
                 core::ConfigurationException);
    EXPECT_THROW(StrategyFactory::createStrategy(json{{"type", "SMA"}, {"short_window", 60}}),
                 core::ConfigurationException);
    EXPECT_THROW(StrategyFactory::createStrategy(json{{"type", "RSI"}, {"oversold", "low"}}),
                 core::ConfigurationException);
    EXPECT_THROW(StrategyFactory::createStrategy(json{{"type", "RSI"}, {"overbought", 120}}),
                 core::ConfigurationException);
}

TEST(StrategyFactoryTest, RejectsWindowsBeyondIntRange) {
    // 2^32 + 50 must not wrap around to a valid window of 50
    EXPECT_THROW(StrategyFactory::createStrategy(
                     json::parse(R"({"type": "SMA", "short_window": 20, "long_window": 4294967346})")),
                 core::ConfigurationException);
    EXPECT_THROW(StrategyFactory::createStrategy(
                     json::parse(R"({"type": "EMA", "short_window": -4294967284, "long_window": 26})")),
                 core::ConfigurationException);
    EXPECT_THROW(StrategyFactory::createStrategy(
                     json::parse(R"({"type": "RSI", "period": 18446744073709551615})")),
                 core::ConfigurationException);
}

TEST(StrategyFactoryTest, CreatesListAndSerializesBack) {
    json configs = json::array();
    configs.push_back(json{{"type", "SMA"}, {"short_window", 5}, {"long_window", 10}});
    configs.push_back(json{{"type", "EMA"}});

    const auto strategies = StrategyFactory::createStrategies(configs);
    ASSERT_EQ(strategies.size(), 2u);

    const json sma = StrategyFactory::toJson(strategies[0]);
    EXPECT_EQ(sma["type"], "SMA");
    EXPECT_EQ(sma["short_window"], 5);
    EXPECT_EQ(sma["long_window"], 10);

    EXPECT_THROW(StrategyFactory::createStrategies(json{{"type", "SMA"}}), core::ConfigurationException);
}

TEST(StrategyFactoryTest, DuplicateEntriesCollapse) {
    json configs = json::array();
    configs.push_back(json{{"type", "SMA"}, {"short_window", 5}, {"long_window", 10}});
    configs.push_back(json{{"type", "sma"}, {"short_window", 5}, {"long_window", 10}});
    configs.push_back(json{{"type", "EMA"}, {"short_window", 5}, {"long_window", 10}});
    configs.push_back(json{{"type", "RSI"}});
    configs.push_back(json{{"type", "RSI"}, {"period", 14}, {"oversold", 30}, {"overbought", 70}});

    const auto strategies = StrategyFactory::createStrategies(configs);
    ASSERT_EQ(strategies.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<strategy_engine::SmaCrossoverParams>(strategies[0]));
    EXPECT_TRUE(std::holds_alternative<strategy_engine::EmaCrossoverParams>(strategies[1]));
    EXPECT_TRUE(std::holds_alternative<strategy_engine::RsiThresholdParams>(strategies[2]));
}
