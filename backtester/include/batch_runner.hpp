#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "backtester.hpp"

namespace backtester {

    struct RunRequest {
        std::string symbol;
        core::PriceSeries prices; // Each run owns its copy
        strategy_engine::StrategyConfig strategy;
    };

    enum class RunStatus {
        Completed,
        Failed,
        Cancelled
    };

    std::string runStatusToString(RunStatus status);

    struct RunOutcome {
        std::string symbol;
        std::string strategy_name;
        RunStatus status = RunStatus::Cancelled;
        std::optional<BacktestResult> result; // Set only when Completed
        std::string error_message;            // Set only when Failed
    };

    // Executes independent runs either on a fixed pool of worker threads or
    // inline on the calling thread. Workers take requests in order, so a
    // cancelled batch skips everything not yet picked up. A failing run is
    // recorded and the others continue.
    class BatchRunner {
    public:
        // Called after each run from the thread that executed it
        using RunFinishedCallback = std::function<void(const RunOutcome&)>;

        // max_workers == 0 picks std::thread::hardware_concurrency() (2 if unknown)
        explicit BatchRunner(SimulationConfig config, bool parallel = true, size_t max_workers = 0);

        // Outcomes come back in request order
        std::vector<RunOutcome> runAll(const std::vector<RunRequest>& requests);

        // Runs that have not started yet come back Cancelled. A run in progress finishes.
        void cancel() { cancelled_.store(true); }
        bool isCancelled() const { return cancelled_.load(); }

        void setRunFinishedCallback(RunFinishedCallback callback) { on_finished_ = std::move(callback); }

        size_t getWorkerLimit() const { return max_workers_; }

    private:
        RunOutcome execute(const RunRequest& request) const;
        void notifyFinished(const RunOutcome& outcome) const;
        void drain(const std::vector<RunRequest>& requests,
                   std::vector<RunOutcome>& outcomes,
                   std::atomic<size_t>& next_index) const;

        Backtester backtester_;
        bool parallel_;
        size_t max_workers_;
        std::atomic<bool> cancelled_{false};
        RunFinishedCallback on_finished_;
    };

} // namespace backtester
