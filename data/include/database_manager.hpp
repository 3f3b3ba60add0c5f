#pragma once

#include <string>
#include <vector>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp" // Keep core types

namespace data {

// One row of listCachedSymbols()
struct CachedSymbolInfo {
    std::string symbol;
    long long rows = 0;
    std::string first_date; // YYYY-MM-DD
    std::string last_date;
};

// Daily bar cache in SQLite. Bars are keyed by (symbol, date) with the date
// stored as "YYYY-MM-DD" text, so text comparison orders them by date.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    // Delete copy and move: the handle is owned by exactly one manager
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;
    DatabaseManager(DatabaseManager&&) = delete;
    DatabaseManager& operator=(DatabaseManager&&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // Transactional INSERT OR REPLACE; all rows or none. Returns false on any SQLite error.
    bool saveBars(const std::string& symbol, const core::PriceSeries& bars);

    // Bars with start <= date <= end, ascending. Throws core::DataLoadException on SQLite errors.
    core::PriceSeries queryBars(const std::string& symbol,
                                core::Timestamp start_time,
                                core::Timestamp end_time);

    // Throws core::DataLoadException on SQLite errors
    std::vector<CachedSymbolInfo> listCachedSymbols();

    const std::string& getPath() const { return database_path_; }

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
};

} // namespace data
