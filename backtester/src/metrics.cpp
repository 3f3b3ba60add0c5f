#include "metrics.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <iterator>
#include <numeric>

namespace backtester {

    namespace {

        constexpr double kTradingDaysPerYear = 252.0;

        std::vector<double> periodReturns(const core::EquityCurve& equity_curve) {
            std::vector<double> returns;
            if (equity_curve.size() < 2) {
                return returns;
            }
            returns.reserve(equity_curve.size() - 1);
            for (size_t i = 1; i < equity_curve.size(); ++i) {
                const double previous = equity_curve[i - 1].total_value;
                if (previous == 0.0) {
                    continue;
                }
                returns.push_back(equity_curve[i].total_value / previous - 1.0);
            }
            return returns;
        }

        double mean(const std::vector<double>& values) {
            if (values.empty()) {
                return 0.0;
            }
            return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
        }

        // Population standard deviation around `center`
        double deviation(const std::vector<double>& values, double center) {
            if (values.empty()) {
                return 0.0;
            }
            double sq_sum = 0.0;
            for (double v : values) {
                sq_sum += (v - center) * (v - center);
            }
            return std::sqrt(sq_sum / static_cast<double>(values.size()));
        }

    } // end anonymous namespace

    void BacktestMetrics::logMetrics() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Backtest Metrics ---");
        logger->info("Final Equity: {:.2f}", final_equity);
        logger->info("Total Return: {:.2f}%", total_return_pct);
        logger->info("Total PnL: {:.2f}", total_pnl);
        logger->info("Sharpe Ratio: {:.3f}", sharpe_ratio);
        logger->info("Sortino Ratio: {:.3f}", sortino_ratio);
        logger->info("Max Drawdown: {:.2f}%", max_drawdown_pct);
        logger->info("Volatility (per bar): {:.4f}, annualized: {:.4f}", volatility, annualized_volatility);
        logger->info("Trades: {}", num_trades);
        logger->info("Win Rate: {:.2f}%", win_rate_pct);
        logger->info("Profit Factor: {:.2f}", profit_factor);
        logger->info("Avg Win PnL: {:.2f}", avg_win_pnl);
        logger->info("Avg Loss PnL: {:.2f}", avg_loss_pnl);
        logger->info("------------------------");
    }

    std::map<std::string, double> BacktestMetrics::toMap() const {
        return {
            {"total_return_pct", total_return_pct},
            {"sharpe_ratio", sharpe_ratio},
            {"max_drawdown_pct", max_drawdown_pct},
            {"win_rate_pct", win_rate_pct},
            {"num_trades", static_cast<double>(num_trades)},
            {"volatility", volatility},
            {"final_equity", final_equity},
            {"total_pnl", total_pnl},
            {"annualized_volatility", annualized_volatility},
            {"sortino_ratio", sortino_ratio},
            {"profit_factor", profit_factor},
            {"avg_win_pnl", avg_win_pnl},
            {"avg_loss_pnl", avg_loss_pnl},
        };
    }

    BacktestMetrics calculateMetrics(const core::EquityCurve& equity_curve,
                                     const std::vector<core::Trade>& trades,
                                     double initial_capital)
    {
        BacktestMetrics metrics;

        // --- PnL and Return ---
        metrics.final_equity = equity_curve.empty() ? initial_capital : equity_curve.back().total_value;
        metrics.total_pnl = metrics.final_equity - initial_capital;
        metrics.total_return_pct = (initial_capital > 0.0)
            ? (metrics.final_equity / initial_capital - 1.0) * 100.0
            : 0.0;

        // --- Return distribution ---
        const std::vector<double> returns = periodReturns(equity_curve);
        const double mean_return = mean(returns);
        metrics.volatility = deviation(returns, mean_return);
        metrics.annualized_volatility = metrics.volatility * std::sqrt(kTradingDaysPerYear);
        if (metrics.volatility > 0.0) {
            metrics.sharpe_ratio = mean_return / metrics.volatility * std::sqrt(kTradingDaysPerYear);
        }

        std::vector<double> downside;
        std::copy_if(returns.begin(), returns.end(), std::back_inserter(downside),
                     [](double r) { return r < 0.0; });
        const double downside_dev = deviation(downside, mean(downside));
        if (downside_dev > 0.0) {
            metrics.sortino_ratio = mean_return / downside_dev * std::sqrt(kTradingDaysPerYear);
        }

        // --- Max Drawdown ---
        if (!equity_curve.empty()) {
            double peak = equity_curve.front().total_value;
            double max_drawdown = 0.0;
            for (const auto& point : equity_curve) {
                peak = std::max(peak, point.total_value);
                if (peak > 0.0) {
                    max_drawdown = std::max(max_drawdown, (peak - point.total_value) / peak);
                }
            }
            metrics.max_drawdown_pct = max_drawdown * 100.0;
        }

        // --- Trade-Based Metrics ---
        metrics.num_trades = static_cast<int>(trades.size());
        int winning_trades = 0;
        int losing_trades = 0;
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        for (const auto& trade : trades) {
            if (trade.pnl > 0.0) {
                winning_trades++;
                gross_profit += trade.pnl;
            } else if (trade.pnl < 0.0) {
                losing_trades++;
                gross_loss += trade.pnl; // Loss is negative
            }
        }

        if (metrics.num_trades > 0) {
            metrics.win_rate_pct = 100.0 * static_cast<double>(winning_trades) / metrics.num_trades;
        }

        if (gross_loss < 0.0) {
            metrics.profit_factor = gross_profit / std::abs(gross_loss);
        } else if (gross_profit > 0.0) {
            metrics.profit_factor = std::numeric_limits<double>::infinity();
        }

        metrics.avg_win_pnl = (winning_trades > 0) ? gross_profit / winning_trades : 0.0;
        metrics.avg_loss_pnl = (losing_trades > 0) ? gross_loss / losing_trades : 0.0;

        return metrics;
    }

    double computeBuyAndHoldReturnPct(const core::PriceSeries& prices) {
        if (prices.size() < 2 || prices.front().close == 0.0) {
            return 0.0;
        }
        return (prices.back().close / prices.front().close - 1.0) * 100.0;
    }

} // namespace backtester
