#pragma once

#include <map>
#include <string>
#include <vector>

#include "datatypes.hpp"

namespace backtester {

    // --- Backtest Metrics Struct ---
    // Percentages are expressed in percent (50.0 means 50%).
    struct BacktestMetrics {
        double total_return_pct = 0.0;
        double sharpe_ratio = 0.0;
        double max_drawdown_pct = 0.0;
        double win_rate_pct = 0.0;
        int num_trades = 0;
        double volatility = 0.0;            // Population std of per-bar returns

        double final_equity = 0.0;
        double total_pnl = 0.0;
        double annualized_volatility = 0.0;
        double sortino_ratio = 0.0;
        double profit_factor = 0.0;         // Gross profit / |gross loss|
        double avg_win_pnl = 0.0;
        double avg_loss_pnl = 0.0;          // Negative or zero

        void logMetrics() const;

        // Flat name -> value view, keys are the field names
        std::map<std::string, double> toMap() const;
    };

    // Pure function of its inputs. An empty curve reports initial_capital as final equity.
    BacktestMetrics calculateMetrics(const core::EquityCurve& equity_curve,
                                     const std::vector<core::Trade>& trades,
                                     double initial_capital);

    // (last close / first close - 1) * 100; 0 for fewer than two bars or a zero first close
    double computeBuyAndHoldReturnPct(const core::PriceSeries& prices);

} // namespace backtester
