// backtester/include/portfolio.hpp
#pragma once

#include <vector>
#include <optional>

#include "datatypes.hpp" // Provides core::Timestamp, core::Position, core::Trade, core::EquityPoint

namespace backtester {

    struct SimulationConfig {
        double initial_capital = 10000.0;
        double commission_rate = 0.0; // Fraction of notional charged on each leg
    };

    // What the portfolio hands back once a replay is finished
    struct SimulationResult {
        core::EquityCurve equity_curve;
        std::vector<core::Trade> trades;
        std::optional<core::Position> open_position; // Unrealized at series end
        double final_cash = 0.0;
        int total_executions = 0;
    };

    // --- Portfolio Class Definition ---
    // Single instrument, long-only, at most one open position.
    class Portfolio {
    public:
        explicit Portfolio(double initial_capital, double commission_rate = 0.0);

        // --- Getters ---
        double getCash() const;
        long long getShares() const;
        core::PositionState getState() const;
        const std::optional<core::Position>& getOpenPosition() const;
        // Cash plus the open position marked at `mark_price`
        double getEquity(double mark_price) const;
        const core::EquityCurve& getEquityCurve() const;
        const std::vector<core::Trade>& getTradeLog() const;
        int getTotalExecutions() const { return execution_count_; }

        // --- Modifiers ---
        // Opens a position with as many whole shares as cash allows. Returns false
        // (no state change) when already long, the price is not positive, or no
        // whole share is affordable.
        bool buy(core::Timestamp timestamp, double price);

        // Closes the open position and logs the round trip. Returns false when flat.
        bool sell(core::Timestamp timestamp, double price);

        // Appends one equity point marked at `close_price`
        void recordTimestampValue(core::Timestamp timestamp, double close_price);

        // Moves the curve and trade log out; the portfolio is spent afterwards
        SimulationResult release();

    private:
        double commission_rate_;
        double cash_;
        std::optional<core::Position> position_;
        core::EquityCurve equity_curve_;
        int execution_count_ = 0;
        std::vector<core::Trade> trade_log_;
    };

} // namespace backtester
