#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <fstream>

namespace core {
namespace config {

    namespace {

        std::string requireString(const json& config, const char* key) {
            if (!config.contains(key) || !config[key].is_string()) {
                throw ConfigurationException(fmt::format("Run config requires '{}' (string).", key));
            }
            return config[key].get<std::string>();
        }

        std::string requireDate(const json& config, const char* key) {
            std::string value = requireString(config, key);
            if (!utils::isValidDate(value)) {
                throw ConfigurationException(fmt::format("Run config '{}' is not a YYYY-MM-DD date: {}", key, value));
            }
            return value;
        }

        double optionalNumber(const json& config, const char* key, double default_value) {
            if (!config.contains(key)) return default_value;
            if (!config[key].is_number()) {
                throw ConfigurationException(fmt::format("Run config '{}' must be a number.", key));
            }
            return config[key].get<double>();
        }

        std::string optionalString(const json& config, const char* key, const std::string& default_value) {
            if (!config.contains(key)) return default_value;
            if (!config[key].is_string()) {
                throw ConfigurationException(fmt::format("Run config '{}' must be a string.", key));
            }
            return config[key].get<std::string>();
        }

    } // end anonymous namespace

    json loadJsonFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw DataLoadException(fmt::format("Failed to open JSON file: {}", path));
        }
        try {
            return json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw DataLoadException(fmt::format("Failed to parse JSON file '{}': {}", path, e.what()));
        }
    }

    RunSettings parseRunSettings(const json& config) {
        if (!config.is_object()) {
            throw ConfigurationException("Run config must be a JSON object.");
        }

        RunSettings settings;

        if (!config.contains("symbols") || !config["symbols"].is_array() || config["symbols"].empty()) {
            throw ConfigurationException("Run config requires 'symbols' (non-empty array of strings).");
        }
        for (const auto& symbol : config["symbols"]) {
            if (!symbol.is_string() || symbol.get<std::string>().empty()) {
                throw ConfigurationException("Every entry of 'symbols' must be a non-empty string.");
            }
            settings.symbols.push_back(symbol.get<std::string>());
        }

        settings.start_date = requireDate(config, "start_date");
        settings.end_date = requireDate(config, "end_date");
        // Same fixed-width format, so lexical order is date order
        if (settings.start_date > settings.end_date) {
            throw ConfigurationException(fmt::format("start_date {} is after end_date {}.",
                                                     settings.start_date, settings.end_date));
        }

        settings.initial_capital = optionalNumber(config, "initial_capital", settings.initial_capital);
        if (!(settings.initial_capital > 0.0)) {
            throw ConfigurationException(fmt::format("initial_capital must be positive, got {}.", settings.initial_capital));
        }
        settings.commission_rate = optionalNumber(config, "commission_rate", settings.commission_rate);
        if (settings.commission_rate < 0.0 || settings.commission_rate >= 1.0) {
            throw ConfigurationException(fmt::format("commission_rate must be in [0, 1), got {}.", settings.commission_rate));
        }

        settings.data_dir = optionalString(config, "data_dir", settings.data_dir);
        settings.cache_db = optionalString(config, "cache_db", settings.cache_db);
        settings.report_dir = optionalString(config, "report_dir", settings.report_dir);

        if (config.contains("parallel")) {
            if (!config["parallel"].is_boolean()) {
                throw ConfigurationException("Run config 'parallel' must be a boolean.");
            }
            settings.parallel = config["parallel"].get<bool>();
        }

        if (config.contains("strategies")) {
            if (!config["strategies"].is_array() || config["strategies"].empty()) {
                throw ConfigurationException("Run config 'strategies' must be a non-empty array.");
            }
            settings.strategies = config["strategies"];
        } else {
            settings.strategies = json::array();
            settings.strategies.push_back(json{{"type", "SMA"}});
            settings.strategies.push_back(json{{"type", "EMA"}});
            settings.strategies.push_back(json{{"type", "RSI"}});
        }

        core::logging::getLogger()->debug("Run config parsed: {} symbol(s), {} strategy(ies), {} to {}",
                                          settings.symbols.size(), settings.strategies.size(),
                                          settings.start_date, settings.end_date);
        return settings;
    }

    RunSettings loadRunSettings(const std::string& path) {
        core::logging::getLogger()->info("Loading run config from: {}", path);
        return parseRunSettings(loadJsonFile(path));
    }

} // namespace config
} // namespace core
