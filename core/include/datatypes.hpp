#pragma once

#include <vector>
#include <chrono> // For timestamps

namespace core {

    // Daily bars carry the calendar date at 00:00 UTC
    using Timestamp = std::chrono::system_clock::time_point;


    struct PriceBar {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const PriceBar& other) const {
            return timestamp < other.timestamp;
        }
    };

    enum class SignalAction {
        Hold,
        Buy,
        Sell
    };

    // Represents the current state of the simulated position
    enum class PositionState {
        Flat,
        Long
    };

    struct Signal {
        Timestamp timestamp;
        SignalAction action = SignalAction::Hold;
    };

    // Long-only, at most one open position per run
    struct Position {
        long long shares = 0;
        double average_entry_price = 0.0;
        Timestamp entry_time;
        double entry_commission = 0.0; // Commission paid on entry
    };


    struct Trade {
        core::Timestamp entry_time;
        double entry_price = 0.0;
        core::Timestamp exit_time;
        double exit_price = 0.0;
        long long shares = 0;
        double commission = 0.0;      // Total commission (entry + exit)
        double pnl = 0.0;             // Profit or Loss for this trade
        double pnl_pct = 0.0;         // (exit / entry - 1) * 100
    };

    struct EquityPoint {
        core::Timestamp timestamp;
        double cash = 0.0;
        double position_value = 0.0; // shares * close
        double total_value = 0.0;     // cash + position_value
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    using PriceSeries = TimeSeries<PriceBar>;
    using SignalSeries = TimeSeries<Signal>;
    using EquityCurve = TimeSeries<EquityPoint>;

} // namespace core
