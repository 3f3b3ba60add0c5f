#include "price_series_provider.hpp"
#include "csv_loader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <filesystem>
#include <utility>

namespace data {

    PriceSeriesProvider::PriceSeriesProvider(DatabaseManager& db_manager, std::string data_dir)
        : db_manager_(db_manager), data_dir_(std::move(data_dir))
    {
    }

    std::string PriceSeriesProvider::csvPathFor(const std::string& symbol) const {
        return (std::filesystem::path(data_dir_) / (symbol + ".csv")).string();
    }

    size_t PriceSeriesProvider::importCsv(const std::string& symbol, const std::string& csv_path) {
        auto logger = core::logging::getLogger();

        core::PriceSeries bars = CsvLoader::loadFile(csv_path);
        core::utils::validatePriceSeries(bars);

        if (!db_manager_.saveBars(symbol, bars)) {
            logger->error("Failed to store {} bars for {} in cache {}.", bars.size(), symbol, db_manager_.getPath());
            throw core::DataLoadException(
                fmt::format("Failed to store bars for {} in cache '{}'.", symbol, db_manager_.getPath()));
        }
        return bars.size();
    }

    core::PriceSeries PriceSeriesProvider::load(const std::string& symbol, core::Timestamp start, core::Timestamp end) {
        auto logger = core::logging::getLogger();
        const std::string start_str = core::utils::timestampToDate(start);
        const std::string end_str = core::utils::timestampToDate(end);

        core::PriceSeries cached = db_manager_.queryBars(symbol, start, end);
        if (!cached.empty()) {
            logger->info("Cache hit for {}: {} bars ({} to {}).", symbol, cached.size(), start_str, end_str);
            return cached;
        }

        const std::string csv_path = csvPathFor(symbol);
        if (!std::filesystem::exists(csv_path)) {
            logger->error("No cached bars for {} in {}..{} and no CSV at {}.", symbol, start_str, end_str, csv_path);
            throw core::DataLoadException(
                fmt::format("No data for {}: cache empty for {}..{} and '{}' not found.",
                            symbol, start_str, end_str, csv_path));
        }

        logger->info("Cache miss for {}; importing {}.", symbol, csv_path);
        importCsv(symbol, csv_path);

        core::PriceSeries bars = db_manager_.queryBars(symbol, start, end);
        if (bars.empty()) {
            logger->error("{} has no bars between {} and {}.", csv_path, start_str, end_str);
            throw core::DataLoadException(
                fmt::format("No bars for {} between {} and {}.", symbol, start_str, end_str));
        }
        return bars;
    }

} // namespace data
