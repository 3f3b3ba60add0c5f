#include "portfolio.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm> // For std::max
#include <cmath>     // For std::floor
#include <limits>
#include <stdexcept> // For invalid_argument
#include <utility>

namespace backtester {

    Portfolio::Portfolio(double initial_capital, double commission_rate)
        : commission_rate_(commission_rate), cash_(initial_capital) {
        if (!(initial_capital > 0) || !std::isfinite(initial_capital)) {
            throw std::invalid_argument("Initial capital must be positive.");
        }
        if (commission_rate < 0.0 || commission_rate >= 1.0) {
            throw std::invalid_argument("Commission rate must be in [0, 1).");
        }
    }

    double Portfolio::getCash() const {
        return cash_;
    }

    long long Portfolio::getShares() const {
        return position_ ? position_->shares : 0;
    }

    core::PositionState Portfolio::getState() const {
        return position_ ? core::PositionState::Long : core::PositionState::Flat;
    }

    const std::optional<core::Position>& Portfolio::getOpenPosition() const {
        return position_;
    }

    double Portfolio::getEquity(double mark_price) const {
        return cash_ + static_cast<double>(getShares()) * mark_price;
    }

    const core::EquityCurve& Portfolio::getEquityCurve() const {
        return equity_curve_;
    }

    const std::vector<core::Trade>& Portfolio::getTradeLog() const {
        return trade_log_;
    }

    bool Portfolio::buy(core::Timestamp timestamp, double price) {
        auto logger = core::logging::getLogger();

        if (position_) {
            logger->debug("Ignoring BUY on {}: already long {} shares.",
                          core::utils::timestampToDate(timestamp), position_->shares);
            return false;
        }
        if (!(price > 0.0)) {
            logger->warn("Ignoring BUY on {}: non-positive price {:.4f}.",
                         core::utils::timestampToDate(timestamp), price);
            return false;
        }

        const double cost_per_share = price * (1.0 + commission_rate_);
        const double affordable = std::floor(cash_ / cost_per_share);
        // 2^63 is exact as a double; anything at or above it does not fit a long long
        constexpr long long kMaxShares = std::numeric_limits<long long>::max();
        auto shares = affordable < static_cast<double>(kMaxShares)
                          ? static_cast<long long>(affordable)
                          : kMaxShares;
        // Rounding in the division can leave the order a hair over budget. Past
        // 2^53 shares a single-share step no longer changes the product.
        while (shares > 0 && static_cast<double>(shares) * cost_per_share > cash_) {
            shares -= std::max<long long>(1, shares >> 50);
        }
        if (shares <= 0) {
            logger->debug("Ignoring BUY on {}: cash {:.2f} does not cover one share at {:.2f}.",
                          core::utils::timestampToDate(timestamp), cash_, price);
            return false;
        }

        const double notional = static_cast<double>(shares) * price;
        const double commission = notional * commission_rate_;
        cash_ -= notional + commission;

        core::Position position;
        position.shares = shares;
        position.average_entry_price = price;
        position.entry_time = timestamp;
        position.entry_commission = commission;
        position_ = position;
        execution_count_++;

        logger->info("BUY  {} x {} @ {:.2f} (Comm={:.2f}), NewCash={:.2f}",
                     core::utils::timestampToDate(timestamp), shares, price, commission, cash_);
        return true;
    }

    bool Portfolio::sell(core::Timestamp timestamp, double price) {
        auto logger = core::logging::getLogger();

        if (!position_) {
            logger->debug("Ignoring SELL on {}: no open position.", core::utils::timestampToDate(timestamp));
            return false;
        }

        const core::Position& entry = *position_;
        const double notional = static_cast<double>(entry.shares) * price;
        const double commission = notional * commission_rate_;
        cash_ += notional - commission;
        execution_count_++;

        core::Trade trade;
        trade.entry_time = entry.entry_time;
        trade.entry_price = entry.average_entry_price;
        trade.exit_time = timestamp;
        trade.exit_price = price;
        trade.shares = entry.shares;
        trade.commission = entry.entry_commission + commission;
        trade.pnl = static_cast<double>(entry.shares) * (price - entry.average_entry_price) - trade.commission;
        trade.pnl_pct = (price / entry.average_entry_price - 1.0) * 100.0;
        trade_log_.push_back(trade);

        logger->info("SELL {} x {} @ {:.2f} (Comm={:.2f}), NewCash={:.2f}, PnL={:.2f} ({:.2f}%)",
                     core::utils::timestampToDate(timestamp), trade.shares, price, commission,
                     cash_, trade.pnl, trade.pnl_pct);

        position_.reset();
        return true;
    }

    void Portfolio::recordTimestampValue(core::Timestamp timestamp, double close_price) {
        core::EquityPoint point;
        point.timestamp = timestamp;
        point.cash = cash_;
        point.position_value = static_cast<double>(getShares()) * close_price;
        point.total_value = point.cash + point.position_value;
        equity_curve_.push_back(point);
    }

    SimulationResult Portfolio::release() {
        SimulationResult result;
        result.equity_curve = std::move(equity_curve_);
        result.trades = std::move(trade_log_);
        result.open_position = position_;
        result.final_cash = cash_;
        result.total_executions = execution_count_;

        equity_curve_.clear();
        trade_log_.clear();
        return result;
    }

} // namespace backtester
