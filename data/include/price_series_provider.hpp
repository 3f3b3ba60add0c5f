#pragma once

#include <string>

#include "datatypes.hpp"
#include "database_manager.hpp"

namespace data {

    // Cache-first loader: bars come from the SQLite cache when it has any for the
    // requested range, otherwise <data_dir>/<symbol>.csv is imported into the cache.
    class PriceSeriesProvider {
    public:
        // `db_manager` must outlive the provider and be connected with its schema initialized
        PriceSeriesProvider(DatabaseManager& db_manager, std::string data_dir);

        // Inclusive date range. Throws core::DataLoadException when neither source
        // has bars in range, and core::DataQualityException for a bad CSV series.
        core::PriceSeries load(const std::string& symbol, core::Timestamp start, core::Timestamp end);

        // Parses, validates and caches a CSV file. Returns the number of bars stored.
        size_t importCsv(const std::string& symbol, const std::string& csv_path);

        std::string csvPathFor(const std::string& symbol) const;

    private:
        DatabaseManager& db_manager_; // Doesn't own it
        std::string data_dir_;
    };

} // namespace data
