#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include "portfolio.hpp"
#include "utils.hpp"

namespace {

    core::Timestamp day(const char* date) {
        return core::utils::dateToTimestamp(date);
    }

} // namespace

TEST(PortfolioTest, BuysWholeSharesWithAvailableCash) {
    backtester::Portfolio portfolio(1000.0);
    EXPECT_EQ(portfolio.getState(), core::PositionState::Flat);

    ASSERT_TRUE(portfolio.buy(day("2024-01-04"), 12.0));
    EXPECT_EQ(portfolio.getState(), core::PositionState::Long);
    EXPECT_EQ(portfolio.getShares(), 83);
    EXPECT_DOUBLE_EQ(portfolio.getCash(), 4.0);
    EXPECT_DOUBLE_EQ(portfolio.getEquity(12.0), 1000.0);
}

TEST(PortfolioTest, ShareCountBeyondIntegerRangeIsCapped) {
    backtester::Portfolio portfolio(1e8);
    ASSERT_TRUE(portfolio.buy(day("2024-01-04"), 1e-12));
    EXPECT_EQ(portfolio.getShares(), std::numeric_limits<long long>::max());
    EXPECT_GT(portfolio.getCash(), 0.0);
    EXPECT_NEAR(portfolio.getEquity(1e-12), 1e8, 1.0);
}

TEST(PortfolioTest, HugeShareCountStaysWithinCash) {
    backtester::Portfolio portfolio(1e8);
    ASSERT_TRUE(portfolio.buy(day("2024-01-04"), 1e-10));
    EXPECT_GT(portfolio.getShares(), 0);
    EXPECT_GE(portfolio.getCash(), 0.0);
    EXPECT_LE(static_cast<double>(portfolio.getShares()) * 1e-10, 1e8);
}

TEST(PortfolioTest, SellRecordsRoundTrip) {
    backtester::Portfolio portfolio(1000.0);
    ASSERT_TRUE(portfolio.buy(day("2024-01-04"), 12.0));
    ASSERT_TRUE(portfolio.sell(day("2024-01-07"), 8.0));

    EXPECT_EQ(portfolio.getState(), core::PositionState::Flat);
    EXPECT_DOUBLE_EQ(portfolio.getCash(), 668.0);
    ASSERT_EQ(portfolio.getTradeLog().size(), 1u);
    const auto& trade = portfolio.getTradeLog().front();
    EXPECT_EQ(trade.shares, 83);
    EXPECT_DOUBLE_EQ(trade.pnl, -332.0);
    EXPECT_NEAR(trade.pnl_pct, -100.0 / 3.0, 1e-9);
    EXPECT_EQ(core::utils::timestampToDate(trade.entry_time), "2024-01-04");
    EXPECT_EQ(core::utils::timestampToDate(trade.exit_time), "2024-01-07");
    EXPECT_EQ(portfolio.getTotalExecutions(), 2);
}

TEST(PortfolioTest, IgnoresRedundantOrUnaffordableOrders) {
    backtester::Portfolio portfolio(100.0);
    EXPECT_FALSE(portfolio.sell(day("2024-01-01"), 10.0));   // flat
    EXPECT_FALSE(portfolio.buy(day("2024-01-01"), 150.0));   // not one share
    EXPECT_FALSE(portfolio.buy(day("2024-01-01"), 0.0));     // no price
    EXPECT_EQ(portfolio.getState(), core::PositionState::Flat);
    EXPECT_DOUBLE_EQ(portfolio.getCash(), 100.0);

    ASSERT_TRUE(portfolio.buy(day("2024-01-02"), 10.0));
    EXPECT_FALSE(portfolio.buy(day("2024-01-03"), 5.0));      // already long
    EXPECT_EQ(portfolio.getShares(), 10);
    EXPECT_TRUE(portfolio.getTradeLog().empty());
}

TEST(PortfolioTest, ChargesCommissionOnBothLegs) {
    backtester::Portfolio portfolio(1000.0, 0.01);
    // floor(1000 / (100 * 1.01)) = 9
    ASSERT_TRUE(portfolio.buy(day("2024-01-01"), 100.0));
    EXPECT_EQ(portfolio.getShares(), 9);
    EXPECT_NEAR(portfolio.getCash(), 1000.0 - 900.0 - 9.0, 1e-9);

    ASSERT_TRUE(portfolio.sell(day("2024-01-02"), 110.0));
    const auto& trade = portfolio.getTradeLog().front();
    EXPECT_NEAR(trade.commission, 9.0 + 9.9, 1e-9);
    EXPECT_NEAR(trade.pnl, 90.0 - 18.9, 1e-9);
    EXPECT_NEAR(trade.pnl_pct, 10.0, 1e-9);
    EXPECT_NEAR(portfolio.getCash(), 1000.0 + trade.pnl, 1e-9);
}

TEST(PortfolioTest, EquityPointsMarkToClose) {
    backtester::Portfolio portfolio(1000.0);
    portfolio.recordTimestampValue(day("2024-01-01"), 100.0);
    ASSERT_TRUE(portfolio.buy(day("2024-01-02"), 100.0));
    portfolio.recordTimestampValue(day("2024-01-02"), 100.0);
    portfolio.recordTimestampValue(day("2024-01-03"), 120.0);

    const auto& curve = portfolio.getEquityCurve();
    ASSERT_EQ(curve.size(), 3u);
    EXPECT_DOUBLE_EQ(curve[0].total_value, 1000.0);
    EXPECT_DOUBLE_EQ(curve[1].position_value, 1000.0);
    EXPECT_DOUBLE_EQ(curve[1].cash, 0.0);
    EXPECT_DOUBLE_EQ(curve[2].total_value, 1200.0);
    for (const auto& point : curve) {
        EXPECT_DOUBLE_EQ(point.total_value, point.cash + point.position_value);
    }
}

TEST(PortfolioTest, ReleaseHandsOverOpenPosition) {
    backtester::Portfolio portfolio(500.0);
    ASSERT_TRUE(portfolio.buy(day("2024-01-02"), 50.0));
    portfolio.recordTimestampValue(day("2024-01-02"), 50.0);

    auto result = portfolio.release();
    ASSERT_TRUE(result.open_position.has_value());
    EXPECT_EQ(result.open_position->shares, 10);
    EXPECT_EQ(result.equity_curve.size(), 1u);
    EXPECT_TRUE(result.trades.empty());
    EXPECT_DOUBLE_EQ(result.final_cash, 0.0);
}

TEST(PortfolioTest, RejectsInvalidSetup) {
    EXPECT_THROW(backtester::Portfolio(0.0), std::invalid_argument);
    EXPECT_THROW(backtester::Portfolio(100.0, 1.0), std::invalid_argument);
}
