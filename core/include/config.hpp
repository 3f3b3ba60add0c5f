#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace core {
namespace config {

    using json = nlohmann::json;

    // Settings for one CLI invocation, read from a JSON run file.
    // Strategy objects are left as JSON and handed to StrategyFactory.
    struct RunSettings {
        std::vector<std::string> symbols;
        std::string start_date;          // YYYY-MM-DD, inclusive
        std::string end_date;            // YYYY-MM-DD, inclusive
        double initial_capital = 10000.0;
        double commission_rate = 0.0;    // Fraction of notional per leg
        std::string data_dir = "data";
        std::string cache_db = "data/price_cache.db";
        std::string report_dir;          // Empty -> no JSON reports
        bool parallel = true;
        json strategies = json::array();
    };

    // Throws ConfigurationException (missing/invalid keys) or DataLoadException (unreadable file)
    RunSettings loadRunSettings(const std::string& path);
    RunSettings parseRunSettings(const json& config);

    // Reads and parses a JSON document. Throws DataLoadException.
    json loadJsonFile(const std::string& path);

} // namespace config
} // namespace core
