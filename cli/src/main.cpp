// cli/src/main.cpp

// Standard includes
#include <atomic>
#include <iostream>
#include <string>
#include <vector>
#include <exception>
#include <memory>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "config.hpp"
#include "database_manager.hpp"
#include "price_series_provider.hpp"
#include "strategy_factory.hpp"
#include "batch_runner.hpp"
#include "report_writer.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/fmt.h>

namespace {

    void printUsage() {
        std::cerr << "Usage:\n"
                  << "  backtester_cli <run_config.json>\n"
                  << "  backtester_cli --import <symbol> <csv_file> <cache_db>\n"
                  << "  backtester_cli --list <cache_db>\n";
    }

    // Opens the cache and makes sure the price table exists
    void openCache(data::DatabaseManager& db_manager) {
        if (!db_manager.connect()) {
            throw core::DataLoadException(fmt::format("Cannot open price cache '{}'.", db_manager.getPath()));
        }
        if (!db_manager.initializeSchema()) {
            throw core::DataLoadException(fmt::format("Cannot initialize schema in '{}'.", db_manager.getPath()));
        }
    }

    int runImport(const std::string& symbol, const std::string& csv_path, const std::string& cache_db) {
        auto logger = core::logging::getLogger();
        data::DatabaseManager db_manager(cache_db);
        openCache(db_manager);

        data::PriceSeriesProvider provider(db_manager, "");
        size_t stored = provider.importCsv(symbol, csv_path);
        std::cout << fmt::format("Imported {} bars for {} into {}\n", stored, symbol, cache_db);
        logger->info("Import of {} complete.", symbol);
        return 0;
    }

    int runList(const std::string& cache_db) {
        data::DatabaseManager db_manager(cache_db);
        openCache(db_manager);

        const auto symbols = db_manager.listCachedSymbols();
        if (symbols.empty()) {
            std::cout << "Cache is empty.\n";
            return 0;
        }
        std::cout << fmt::format("{:<12} {:>8} {:>12} {:>12}\n", "Symbol", "Bars", "First", "Last");
        for (const auto& info : symbols) {
            std::cout << fmt::format("{:<12} {:>8} {:>12} {:>12}\n",
                                     info.symbol, info.rows, info.first_date, info.last_date);
        }
        return 0;
    }

    void printComparison(const std::vector<backtester::RunOutcome>& outcomes) {
        std::cout << fmt::format("\n{:<10} {:<16} {:>10} {:>10} {:>8} {:>10} {:>8} {:>7}  {}\n",
                                 "Symbol", "Strategy", "Return%", "B&H%", "Sharpe", "MaxDD%", "Win%", "Trades", "Status");
        for (const auto& outcome : outcomes) {
            if (outcome.result) {
                const auto& m = outcome.result->metrics;
                std::cout << fmt::format("{:<10} {:<16} {:>10.2f} {:>10.2f} {:>8.3f} {:>10.2f} {:>8.2f} {:>7}  {}\n",
                                         outcome.symbol, outcome.strategy_name, m.total_return_pct,
                                         outcome.result->buy_hold_return_pct, m.sharpe_ratio,
                                         m.max_drawdown_pct, m.win_rate_pct, m.num_trades,
                                         backtester::runStatusToString(outcome.status));
            } else {
                std::cout << fmt::format("{:<10} {:<16} {:>10} {:>10} {:>8} {:>10} {:>8} {:>7}  {} {}\n",
                                         outcome.symbol, outcome.strategy_name, "-", "-", "-", "-", "-", "-",
                                         backtester::runStatusToString(outcome.status), outcome.error_message);
            }
        }
        std::cout << std::endl;
    }

    int runBacktests(const std::string& config_path) {
        auto logger = core::logging::getLogger();

        // 1. Settings and strategies (validated before any data is touched)
        const core::config::RunSettings settings = core::config::loadRunSettings(config_path);
        const auto strategies = strategy_engine::StrategyFactory::createStrategies(settings.strategies);
        const core::Timestamp start = core::utils::dateToTimestamp(settings.start_date);
        const core::Timestamp end = core::utils::dateToTimestamp(settings.end_date);

        backtester::SimulationConfig sim_config;
        sim_config.initial_capital = settings.initial_capital;
        sim_config.commission_rate = settings.commission_rate;

        logger->info("Backtest Parameters: Capital={:.2f}, Commission={}, Start={}, End={}, {} symbols x {} strategies",
                     sim_config.initial_capital, sim_config.commission_rate, settings.start_date, settings.end_date,
                     settings.symbols.size(), strategies.size());

        // 2. Data
        data::DatabaseManager db_manager(settings.cache_db);
        openCache(db_manager);
        data::PriceSeriesProvider provider(db_manager, settings.data_dir);

        std::vector<backtester::RunRequest> requests;
        bool data_failed = false;
        for (const auto& symbol : settings.symbols) {
            core::PriceSeries prices;
            try {
                prices = provider.load(symbol, start, end);
            } catch (const core::BacktesterException& e) {
                logger->error("Skipping {}: {}", symbol, e.what());
                std::cerr << "Data Error (" << symbol << "): " << e.what() << std::endl;
                data_failed = true;
                continue;
            }
            for (const auto& strategy : strategies) {
                requests.push_back(backtester::RunRequest{symbol, prices, strategy});
            }
        }
        db_manager.disconnect();

        // 3. Runs
        backtester::BatchRunner runner(sim_config, settings.parallel);
        const size_t total_runs = requests.size();
        auto finished_runs = std::make_shared<std::atomic<size_t>>(0);
        runner.setRunFinishedCallback([logger, total_runs, finished_runs](const backtester::RunOutcome& outcome) {
            logger->info("[{}/{}] {} / {}: {}", ++*finished_runs, total_runs, outcome.symbol,
                         outcome.strategy_name, backtester::runStatusToString(outcome.status));
        });
        const auto outcomes = runner.runAll(requests);

        // 4. Presentation
        printComparison(outcomes);
        bool run_failed = false;
        std::vector<const backtester::BacktestResult*> completed;
        for (const auto& outcome : outcomes) {
            if (!outcome.result) {
                run_failed = true;
                continue;
            }
            logger->info("=== {} / {} ===", outcome.symbol, outcome.strategy_name);
            outcome.result->metrics.logMetrics();
            completed.push_back(&*outcome.result);
        }
        if (!settings.report_dir.empty()) {
            backtester::ReportWriter::writeAll(completed, settings.report_dir);
        }

        return (data_failed || run_failed) ? 1 : 0;
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    // Define logger pointer early in the main scope
    std::shared_ptr<spdlog::logger> logger = nullptr;

    // Main try block for exception handling
    try {
        // --- Initialize Logging ---
        core::logging::initialize("backtester_cli", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Backtester CLI starting...");

        // --- Argument Parsing ---
        const std::vector<std::string> args(argv + 1, argv + argc);
        int exit_code = 1;
        if (args.size() == 4 && args[0] == "--import") {
            exit_code = runImport(args[1], args[2], args[3]);
        } else if (args.size() == 2 && args[0] == "--list") {
            exit_code = runList(args[1]);
        } else if (args.size() == 1 && args[0].rfind("--", 0) != 0) {
            exit_code = runBacktests(args[0]);
        } else {
            printUsage();
            return 1;
        }

        logger->info("Backtester CLI finished with exit code {}.", exit_code);
        return exit_code;

    // --- Exception Handling ---
    } catch (const core::ConfigurationException& ex) {
        std::cerr << "Configuration Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Configuration Error: {}", ex.what());
        return 1;
    } catch (const core::BacktesterException& ex) {
        std::cerr << "Backtester Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Backtester Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }
}
