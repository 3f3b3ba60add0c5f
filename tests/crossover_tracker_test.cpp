#include <gtest/gtest.h>

#include "crossover_tracker.hpp"

using strategy_engine::CrossType;
using strategy_engine::CrossoverTracker;

TEST(CrossoverTrackerTest, FirstUpdateHasNoCross) {
    CrossoverTracker tracker;
    EXPECT_FALSE(tracker.hasPrevious());
    EXPECT_EQ(tracker.update(5.0, 1.0), CrossType::None);
    EXPECT_TRUE(tracker.hasPrevious());
}

TEST(CrossoverTrackerTest, DetectsCrossAboveFromEqual) {
    CrossoverTracker tracker;
    tracker.update(10.0, 10.0);
    EXPECT_EQ(tracker.update(11.0, 10.5), CrossType::CrossesAbove);
    // Staying above is not a new cross
    EXPECT_EQ(tracker.update(12.0, 11.0), CrossType::None);
}

TEST(CrossoverTrackerTest, DetectsCrossBelow) {
    CrossoverTracker tracker;
    tracker.update(12.0, 11.0);
    EXPECT_EQ(tracker.update(10.0, 10.5), CrossType::CrossesBelow);
}

TEST(CrossoverTrackerTest, TouchingIsNotACross) {
    CrossoverTracker tracker;
    tracker.update(12.0, 11.0);
    EXPECT_EQ(tracker.update(12.0, 12.0), CrossType::None);
    // From equal, moving below counts
    EXPECT_EQ(tracker.update(8.0, 9.0), CrossType::CrossesBelow);
}

TEST(CrossoverTrackerTest, ResetForgetsPreviousBar) {
    CrossoverTracker tracker;
    tracker.update(1.0, 2.0);
    tracker.reset();
    EXPECT_FALSE(tracker.hasPrevious());
    EXPECT_EQ(tracker.update(3.0, 2.0), CrossType::None);
}

TEST(ResolveSignalTest, SellWinsOverBuy) {
    EXPECT_EQ(strategy_engine::resolveSignal(true, true), core::SignalAction::Sell);
    EXPECT_EQ(strategy_engine::resolveSignal(true, false), core::SignalAction::Buy);
    EXPECT_EQ(strategy_engine::resolveSignal(false, true), core::SignalAction::Sell);
    EXPECT_EQ(strategy_engine::resolveSignal(false, false), core::SignalAction::Hold);
}
