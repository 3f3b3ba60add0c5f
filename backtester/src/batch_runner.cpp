#include "batch_runner.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <system_error>
#include <thread>

namespace backtester {

    std::string runStatusToString(RunStatus status) {
        switch (status) {
            case RunStatus::Completed: return "COMPLETED";
            case RunStatus::Failed:    return "FAILED";
            case RunStatus::Cancelled: return "CANCELLED";
        }
        return "UNKNOWN";
    }

    BatchRunner::BatchRunner(SimulationConfig config, bool parallel, size_t max_workers)
        : backtester_(config), parallel_(parallel), max_workers_(max_workers)
    {
        if (max_workers_ == 0) {
            const unsigned hardware = std::thread::hardware_concurrency();
            max_workers_ = hardware > 0 ? hardware : 2;
        }
    }

    RunOutcome BatchRunner::execute(const RunRequest& request) const {
        auto logger = core::logging::getLogger();

        RunOutcome outcome;
        outcome.symbol = request.symbol;
        outcome.strategy_name = strategy_engine::describe(request.strategy);

        if (cancelled_.load()) {
            logger->info("Skipping {} / {}: batch cancelled.", outcome.symbol, outcome.strategy_name);
            outcome.status = RunStatus::Cancelled;
            return outcome;
        }

        try {
            outcome.result = backtester_.run(request.symbol, request.prices, request.strategy);
            outcome.status = RunStatus::Completed;
        } catch (const core::BacktesterException& e) {
            logger->error("Run {} / {} failed: {}", outcome.symbol, outcome.strategy_name, e.what());
            outcome.status = RunStatus::Failed;
            outcome.error_message = e.what();
        } catch (const std::exception& e) {
            logger->critical("Unexpected exception in run {} / {}: {}", outcome.symbol, outcome.strategy_name, e.what());
            outcome.status = RunStatus::Failed;
            outcome.error_message = e.what();
        }
        return outcome;
    }

    void BatchRunner::notifyFinished(const RunOutcome& outcome) const {
        if (!on_finished_) {
            return;
        }
        try {
            on_finished_(outcome);
        } catch (const std::exception& e) {
            core::logging::getLogger()->error("Run-finished callback threw for {} / {}: {}",
                                              outcome.symbol, outcome.strategy_name, e.what());
        }
    }

    // --- Worker loop: claim the next request index until none are left ---
    void BatchRunner::drain(const std::vector<RunRequest>& requests,
                            std::vector<RunOutcome>& outcomes,
                            std::atomic<size_t>& next_index) const
    {
        for (;;) {
            const size_t index = next_index.fetch_add(1);
            if (index >= requests.size()) {
                return;
            }
            outcomes[index] = execute(requests[index]);
            notifyFinished(outcomes[index]);
        }
    }

    std::vector<RunOutcome> BatchRunner::runAll(const std::vector<RunRequest>& requests) {
        auto logger = core::logging::getLogger();

        const size_t worker_count = parallel_ ? std::min(max_workers_, requests.size()) : 0;
        logger->info("Running {} backtests ({}).", requests.size(),
                     worker_count > 0 ? fmt::format("{} workers", worker_count) : std::string("sequential"));

        // Slots are written by index, so each worker touches only its own elements
        std::vector<RunOutcome> outcomes(requests.size());
        std::atomic<size_t> next_index{0};

        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (size_t i = 0; i < worker_count; ++i) {
            try {
                workers.emplace_back([this, &requests, &outcomes, &next_index]() {
                    drain(requests, outcomes, next_index);
                });
            } catch (const std::system_error& e) {
                logger->warn("Could only start {} of {} workers: {}", workers.size(), worker_count, e.what());
                break;
            }
        }

        if (workers.empty()) {
            drain(requests, outcomes, next_index);
        }
        for (auto& worker : workers) {
            worker.join();
        }

        size_t failed = 0;
        size_t cancelled = 0;
        for (const auto& outcome : outcomes) {
            if (outcome.status == RunStatus::Failed) {
                ++failed;
            } else if (outcome.status == RunStatus::Cancelled) {
                ++cancelled;
            }
        }
        logger->info("Batch finished: {} completed, {} failed, {} cancelled.",
                     outcomes.size() - failed - cancelled, failed, cancelled);
        return outcomes;
    }

} // namespace backtester
