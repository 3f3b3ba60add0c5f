#include "report_writer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>

namespace backtester {

    namespace {

        json finiteOrNull(double value) {
            return std::isfinite(value) ? json(value) : json(nullptr);
        }

        std::string sanitize(const std::string& text) {
            std::string out;
            out.reserve(text.size());
            for (unsigned char c : text) {
                if (std::isalnum(c) || c == '-' || c == '.') {
                    out.push_back(static_cast<char>(c));
                } else if (!out.empty() && out.back() != '_') {
                    out.push_back('_');
                }
            }
            while (!out.empty() && out.back() == '_') {
                out.pop_back();
            }
            return out;
        }

    } // end anonymous namespace

    json ReportWriter::toJson(const BacktestResult& result) {
        json metrics = json::object();
        for (const auto& [name, value] : result.metrics.toMap()) {
            metrics[name] = finiteOrNull(value);
        }
        metrics["num_trades"] = result.metrics.num_trades;

        json trades = json::array();
        for (const auto& trade : result.simulation.trades) {
            trades.push_back({
                {"entry_date", core::utils::timestampToDate(trade.entry_time)},
                {"entry_price", trade.entry_price},
                {"exit_date", core::utils::timestampToDate(trade.exit_time)},
                {"exit_price", trade.exit_price},
                {"shares", trade.shares},
                {"commission", trade.commission},
                {"pnl", trade.pnl},
                {"pnl_pct", trade.pnl_pct},
            });
        }

        json equity = json::array();
        for (const auto& point : result.simulation.equity_curve) {
            equity.push_back({
                {"date", core::utils::timestampToDate(point.timestamp)},
                {"cash", point.cash},
                {"position_value", point.position_value},
                {"total_value", point.total_value},
            });
        }

        json open_position = nullptr;
        if (result.simulation.open_position) {
            const auto& position = *result.simulation.open_position;
            open_position = {
                {"shares", position.shares},
                {"entry_price", position.average_entry_price},
                {"entry_date", core::utils::timestampToDate(position.entry_time)},
            };
        }

        return json{
            {"symbol", result.symbol},
            {"strategy", result.strategy_name},
            {"start_date", result.start_date},
            {"end_date", result.end_date},
            {"buy_hold_return_pct", result.buy_hold_return_pct},
            {"final_cash", result.simulation.final_cash},
            {"open_position", open_position},
            {"metrics", metrics},
            {"trades", trades},
            {"equity_curve", equity},
        };
    }

    std::string ReportWriter::fileStem(const BacktestResult& result) {
        return sanitize(result.symbol) + "_" + sanitize(result.strategy_name);
    }

    std::string ReportWriter::writeJson(const BacktestResult& result, const std::string& dir) {
        return writeFile(result, dir, fileStem(result));
    }

    std::vector<std::string> ReportWriter::writeAll(const std::vector<const BacktestResult*>& results,
                                                    const std::string& dir) {
        auto logger = core::logging::getLogger();

        std::map<std::string, int> stem_counts;
        std::vector<std::string> paths;
        paths.reserve(results.size());
        for (const BacktestResult* result : results) {
            const std::string base = fileStem(*result);
            std::string stem = base;
            // A suffixed name can itself match a later base stem, so keep counting
            while (stem_counts.count(stem) > 0) {
                stem = fmt::format("{}_{}", base, ++stem_counts[base]);
            }
            stem_counts.emplace(stem, 1);
            if (stem != base) {
                logger->warn("Report name '{}' already used in this batch; writing {} / {} as '{}'.",
                             base, result->symbol, result->strategy_name, stem);
            }
            paths.push_back(writeFile(*result, dir, stem));
        }
        return paths;
    }

    std::string ReportWriter::writeFile(const BacktestResult& result, const std::string& dir, const std::string& stem) {
        auto logger = core::logging::getLogger();

        const std::filesystem::path dir_path(dir);
        try {
            if (!std::filesystem::exists(dir_path)) {
                std::filesystem::create_directories(dir_path);
            }
        } catch (const std::filesystem::filesystem_error& fs_err) {
            logger->error("Cannot create report directory '{}': {}", dir, fs_err.what());
            throw core::DataLoadException(fmt::format("Cannot create report directory '{}': {}", dir, fs_err.what()));
        }

        const std::filesystem::path file_path = dir_path / (stem + ".json");
        std::ofstream out(file_path);
        if (!out) {
            logger->error("Cannot open report file '{}' for writing.", file_path.string());
            throw core::DataLoadException(fmt::format("Cannot open report file '{}'.", file_path.string()));
        }
        out << toJson(result).dump(2) << '\n';
        if (!out) {
            throw core::DataLoadException(fmt::format("Failed writing report file '{}'.", file_path.string()));
        }

        logger->info("Report written to {}", file_path.string());
        return file_path.string();
    }

} // namespace backtester
