#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToDate/dateToTimestamp
#include <spdlog/fmt/fmt.h>

#include <stdexcept>

namespace data
{

    namespace
    {
        // Owns a prepared statement for the duration of one call
        struct StatementGuard
        {
            sqlite3_stmt *stmt = nullptr;
            ~StatementGuard() { sqlite3_finalize(stmt); }
        };

        std::string columnText(sqlite3_stmt *stmt, int column)
        {
            const unsigned char *text = sqlite3_column_text(stmt, column);
            return text ? std::string(reinterpret_cast<const char *>(text)) : std::string();
        }
    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect(); // Ensure disconnection
    }

    bool DatabaseManager::connect()
    {
        auto logger = core::logging::getLogger();
        if (connected_)
        {
            logger->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        logger->info("Connecting to SQLite database: {}", database_path_);

        // SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE: Open for reading/writing, create if not exists
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            logger->error("Cannot open SQLite database '{}': {}", database_path_,
                          db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000); // Wait 5 seconds if busy
        logger->debug("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (connected_)
        {
            core::logging::getLogger()->debug("Disconnecting from SQLite database: {}", database_path_);
            int rc = sqlite3_close(db_);
            if (rc != SQLITE_OK)
            {
                // This usually happens if prepared statements are not finalized
                core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
            }
            db_ = nullptr;
            connected_ = false;
        }
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        logger->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            logger->error("SQL error: {}", error_msg ? error_msg : sqlite3_errstr(rc));
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        logger->debug("Initializing SQLite database schema if needed...");

        const std::string create_bars_sql = R"(
        CREATE TABLE IF NOT EXISTS price_bars (
            symbol TEXT NOT NULL,
            date TEXT NOT NULL, -- YYYY-MM-DD
            open REAL,
            high REAL,
            low REAL,
            close REAL NOT NULL,
            volume INTEGER,
            PRIMARY KEY (symbol, date)
        );
    )";

        bool success = executeSQL(create_bars_sql);
        if (!success)
        {
            logger->error("SQLite database schema initialization failed.");
        }
        return success;
    }

    bool DatabaseManager::saveBars(const std::string &symbol, const core::PriceSeries &bars)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save bars: Not connected to database.");
            return false;
        }
        if (bars.empty())
        {
            logger->debug("No bars provided to save for {}.", symbol);
            return true; // Nothing to do, report success
        }

        const char *sql = R"(
INSERT OR REPLACE INTO price_bars
(symbol, date, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?);
)";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            return false;
        }

        // Begin transaction for efficiency
        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving bars.");
            return false;
        }

        bool success = true;
        for (const auto &bar : bars)
        {
            // Indexes are 1-based
            const std::string date = core::utils::timestampToDate(bar.timestamp);
            sqlite3_bind_text(guard.stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(guard.stmt, 2, date.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(guard.stmt, 3, bar.open);
            sqlite3_bind_double(guard.stmt, 4, bar.high);
            sqlite3_bind_double(guard.stmt, 5, bar.low);
            sqlite3_bind_double(guard.stmt, 6, bar.close);
            sqlite3_bind_int64(guard.stmt, 7, bar.volume);

            rc = sqlite3_step(guard.stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to insert bar {} {} [{}]: {}", symbol, date, rc, sqlite3_errmsg(db_));
                success = false;
                break; // Exit loop on first error
            }

            rc = sqlite3_reset(guard.stmt);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Commit or rollback transaction
        if (success)
        {
            if (!executeSQL("COMMIT;"))
            {
                logger->error("Failed to COMMIT transaction for saving bars.");
                if (!executeSQL("ROLLBACK;"))
                {
                    logger->error("ROLLBACK after failed COMMIT also failed for {}.", symbol);
                }
                return false;
            }
            logger->info("Saved {} bars for {} to cache.", bars.size(), symbol);
            return true;
        }

        if (!executeSQL("ROLLBACK;"))
        {
            logger->error("Failed to ROLLBACK transaction for saving bars.");
        }
        logger->warn("Transaction rolled back due to error during bar save for {}.", symbol);
        return false;
    }

    core::PriceSeries DatabaseManager::queryBars(const std::string &symbol,
                                                 core::Timestamp start_time,
                                                 core::Timestamp end_time)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query bars: Not connected to database.");
            throw core::DataLoadException(fmt::format("Price cache '{}' is not connected.", database_path_));
        }

        const std::string start_str = core::utils::timestampToDate(start_time);
        const std::string end_str = core::utils::timestampToDate(end_time);
        logger->debug("Querying bars for {} between '{}' and '{}'", symbol, start_str, end_str);

        const char *sql = R"(
            SELECT date, open, high, low, close, volume
            FROM price_bars
            WHERE symbol = ?
              AND date >= ?
              AND date <= ?
            ORDER BY date ASC;
        )";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare SELECT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            throw core::DataLoadException(fmt::format("Cannot query price cache: {}", sqlite3_errmsg(db_)));
        }

        sqlite3_bind_text(guard.stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 2, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 3, end_str.c_str(), -1, SQLITE_TRANSIENT);

        core::PriceSeries bars;
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
        {
            const std::string date = columnText(guard.stmt, 0);
            core::PriceBar bar;
            try
            {
                bar.timestamp = core::utils::dateToTimestamp(date);
            }
            catch (const std::invalid_argument &e)
            {
                logger->error("Corrupt date '{}' in cache for {}: {}", date, symbol, e.what());
                throw core::DataLoadException(fmt::format("Corrupt date '{}' in price cache for {}.", date, symbol));
            }
            bar.open = sqlite3_column_double(guard.stmt, 1);
            bar.high = sqlite3_column_double(guard.stmt, 2);
            bar.low = sqlite3_column_double(guard.stmt, 3);
            bar.close = sqlite3_column_double(guard.stmt, 4);
            bar.volume = sqlite3_column_int64(guard.stmt, 5);
            bars.push_back(bar);
        }

        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through query results [{}]: {}", rc, sqlite3_errmsg(db_));
            throw core::DataLoadException(fmt::format("Error reading price cache: {}", sqlite3_errmsg(db_)));
        }

        logger->debug("Loaded {} cached bars for {}.", bars.size(), symbol);
        return bars;
    }

    std::vector<CachedSymbolInfo> DatabaseManager::listCachedSymbols()
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot list symbols: Not connected to database.");
            throw core::DataLoadException(fmt::format("Price cache '{}' is not connected.", database_path_));
        }

        const char *sql = R"(
            SELECT symbol, COUNT(*), MIN(date), MAX(date)
            FROM price_bars
            GROUP BY symbol
            ORDER BY symbol ASC;
        )";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare listing statement [{}]: {}", rc, sqlite3_errmsg(db_));
            throw core::DataLoadException(fmt::format("Cannot list price cache: {}", sqlite3_errmsg(db_)));
        }

        std::vector<CachedSymbolInfo> symbols;
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
        {
            CachedSymbolInfo info;
            info.symbol = columnText(guard.stmt, 0);
            info.rows = sqlite3_column_int64(guard.stmt, 1);
            info.first_date = columnText(guard.stmt, 2);
            info.last_date = columnText(guard.stmt, 3);
            symbols.push_back(info);
        }

        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through listing results [{}]: {}", rc, sqlite3_errmsg(db_));
            throw core::DataLoadException(fmt::format("Error reading price cache: {}", sqlite3_errmsg(db_)));
        }
        return symbols;
    }

} // namespace data
