#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "backtester.hpp"

namespace backtester {

    using json = nlohmann::json;

    class ReportWriter {
    public:
        // Metrics, trade log and equity curve of one run. A profit factor of
        // +inf (no losing trades) is written as null.
        static json toJson(const BacktestResult& result);

        // Writes <dir>/<symbol>_<strategy>.json, creating `dir` if needed.
        // Returns the path written. Throws core::DataLoadException on I/O failure.
        static std::string writeJson(const BacktestResult& result, const std::string& dir);

        // One file per result in `dir`. A stem already used in this batch gets a
        // "_2", "_3", ... suffix so no report overwrites another.
        static std::vector<std::string> writeAll(const std::vector<const BacktestResult*>& results,
                                                 const std::string& dir);

        // "SMA(20/50)" -> "SMA_20_50"
        static std::string fileStem(const BacktestResult& result);

    private:
        static std::string writeFile(const BacktestResult& result, const std::string& dir, const std::string& stem);
    };

} // namespace backtester
