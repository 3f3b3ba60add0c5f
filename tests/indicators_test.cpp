#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "sma_indicator.hpp"
#include "ema_indicator.hpp"
#include "rsi_indicator.hpp"
#include "test_helpers.hpp"

using test_helpers::makeSeries;

TEST(SmaIndicatorTest, AveragesTrailingWindow) {
    indicators::SmaIndicator sma(3);
    EXPECT_EQ(sma.getName(), "SMA(3)");
    EXPECT_EQ(sma.getLookback(), 2);

    sma.calculate(makeSeries({1, 2, 3, 4, 5}));
    const auto& result = sma.getResult();
    ASSERT_EQ(result.size(), 3u);
    EXPECT_DOUBLE_EQ(result[0], 2.0);
    EXPECT_DOUBLE_EQ(result[1], 3.0);
    EXPECT_DOUBLE_EQ(result[2], 4.0);
}

TEST(SmaIndicatorTest, AlignedValueMapsToInputBars) {
    indicators::SmaIndicator sma(2);
    sma.calculate(makeSeries({10, 20, 30}));
    EXPECT_FALSE(indicators::alignedValue(sma, 0).has_value());
    ASSERT_TRUE(indicators::alignedValue(sma, 1).has_value());
    EXPECT_DOUBLE_EQ(*indicators::alignedValue(sma, 1), 15.0);
    EXPECT_DOUBLE_EQ(*indicators::alignedValue(sma, 2), 25.0);
    EXPECT_FALSE(indicators::alignedValue(sma, 3).has_value());
}

TEST(SmaIndicatorTest, ShortInputGivesNoResults) {
    indicators::SmaIndicator sma(5);
    sma.calculate(makeSeries({1, 2, 3}));
    EXPECT_TRUE(sma.getResult().empty());
}

TEST(SmaIndicatorTest, RejectsNonPositivePeriod) {
    EXPECT_THROW(indicators::SmaIndicator(0), std::invalid_argument);
    EXPECT_THROW(indicators::SmaIndicator(-3), std::invalid_argument);
}

TEST(EmaIndicatorTest, SeedsWithSimpleAverage) {
    indicators::EmaIndicator ema(3);
    EXPECT_EQ(ema.getLookback(), 2);

    // seed mean(1,2,3) = 2, k = 0.5
    ema.calculate(makeSeries({1, 2, 3, 4, 5}));
    const auto& result = ema.getResult();
    ASSERT_EQ(result.size(), 3u);
    EXPECT_NEAR(result[0], 2.0, 1e-9);
    EXPECT_NEAR(result[1], 3.0, 1e-9);
    EXPECT_NEAR(result[2], 4.0, 1e-9);
}

TEST(EmaIndicatorTest, WeightsRecentCloses) {
    indicators::EmaIndicator ema(2); // k = 2/3
    ema.calculate(makeSeries({10, 10, 13}));
    const auto& result = ema.getResult();
    ASSERT_EQ(result.size(), 2u);
    EXPECT_NEAR(result[0], 10.0, 1e-9);
    EXPECT_NEAR(result[1], 12.0, 1e-9);
}

TEST(EmaIndicatorTest, WindowOneIsTheClose) {
    indicators::EmaIndicator ema(1);
    EXPECT_EQ(ema.getLookback(), 0);
    ema.calculate(makeSeries({4, 7, 5}));
    const auto& result = ema.getResult();
    ASSERT_EQ(result.size(), 3u);
    EXPECT_DOUBLE_EQ(result[0], 4.0);
    EXPECT_DOUBLE_EQ(result[1], 7.0);
    EXPECT_DOUBLE_EQ(result[2], 5.0);
}

TEST(RsiIndicatorTest, WilderSmoothing) {
    indicators::RsiIndicator rsi(2);
    EXPECT_EQ(rsi.getName(), "RSI(2)");
    EXPECT_EQ(rsi.getLookback(), 2);

    // changes +1, -1 -> 50; then +1 -> gain 0.75, loss 0.25 -> 75
    rsi.calculate(makeSeries({1, 2, 1, 2}));
    const auto& result = rsi.getResult();
    ASSERT_EQ(result.size(), 2u);
    EXPECT_NEAR(result[0], 50.0, 1e-9);
    EXPECT_NEAR(result[1], 75.0, 1e-9);
}

TEST(RsiIndicatorTest, NoDeclineReadsHundred) {
    indicators::RsiIndicator rising(3);
    rising.calculate(makeSeries({1, 2, 3, 4, 5, 6}));
    for (double value : rising.getResult()) {
        EXPECT_DOUBLE_EQ(value, 100.0);
    }

    indicators::RsiIndicator flat(3);
    flat.calculate(makeSeries({50, 50, 50, 50, 50}));
    ASSERT_FALSE(flat.getResult().empty());
    for (double value : flat.getResult()) {
        EXPECT_DOUBLE_EQ(value, 100.0);
    }
}

TEST(RsiIndicatorTest, PeriodOneUsesLatestChange) {
    indicators::RsiIndicator rsi(1);
    EXPECT_EQ(rsi.getLookback(), 1);
    rsi.calculate(makeSeries({1, 2, 1, 1}));
    const auto& result = rsi.getResult();
    ASSERT_EQ(result.size(), 3u);
    EXPECT_DOUBLE_EQ(result[0], 100.0);
    EXPECT_DOUBLE_EQ(result[1], 0.0);
    EXPECT_DOUBLE_EQ(result[2], 100.0);
}

TEST(RsiIndicatorTest, LongFlatStretchAfterMoveStaysAtFifty) {
    // Equal gain and loss decay together; the ratio stays 1 long after both
    // averages shrink below 1e-8.
    std::vector<double> closes = {1.0, 1.01, 1.0};
    closes.insert(closes.end(), 250, 1.0);

    indicators::RsiIndicator rsi(14);
    rsi.calculate(makeSeries(closes));
    const auto& result = rsi.getResult();
    ASSERT_EQ(result.size(), closes.size() - 14);
    for (double value : result) {
        EXPECT_NEAR(value, 50.0, 1e-9);
    }
}

TEST(RsiIndicatorTest, TinyPriceScaleKeepsRatio) {
    indicators::RsiIndicator rsi(2);
    rsi.calculate(makeSeries({1e-9, 2e-9, 1e-9, 2e-9}));
    const auto& result = rsi.getResult();
    ASSERT_EQ(result.size(), 2u);
    EXPECT_NEAR(result[0], 50.0, 1e-6);
    EXPECT_NEAR(result[1], 75.0, 1e-6);
}

TEST(RsiIndicatorTest, RejectsNonPositivePeriod) {
    EXPECT_THROW(indicators::RsiIndicator(0), std::invalid_argument);
}
