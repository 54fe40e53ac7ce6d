#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <stdexcept>
#include <chrono>

namespace data
{

    namespace
    {
        // Finalizes a prepared statement when it goes out of scope
        struct StatementGuard
        {
            sqlite3_stmt *stmt = nullptr;
            ~StatementGuard() { sqlite3_finalize(stmt); }
        };
    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000);
        core::logging::getLogger()->debug("Connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Usually means a prepared statement was not finalized
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
        core::logging::getLogger()->debug("Disconnected from SQLite database: {}", database_path_);
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->debug("Initializing SQLite database schema if needed...");

        const std::string create_candles_sql = R"(
        CREATE TABLE IF NOT EXISTS historical_candles (
            symbol TEXT,
            interval TEXT,
            timestamp TEXT, -- ISO8601 UTC, e.g. 2025-11-12T21:00:00+00:00
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            volume INTEGER,
            PRIMARY KEY (symbol, interval, timestamp)
        );
    )";

        const std::string create_candles_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_candles_timestamp
        ON historical_candles (symbol, interval, timestamp);
     )";

        const std::string create_constituents_sql = R"(
        CREATE TABLE IF NOT EXISTS index_constituents (
            index_key TEXT,
            constituent_key TEXT,
            as_of_date TEXT, -- YYYY-MM-DD
            PRIMARY KEY (index_key, constituent_key, as_of_date)
        );
    )";

        bool success = true;
        success &= executeSQL(create_candles_sql);
        success &= executeSQL(create_candles_index_sql);
        success &= executeSQL(create_constituents_sql);

        if (!success)
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryRecentCandles(
        const std::string& symbol,
        const std::string& interval,
        int bar_count,
        core::Timestamp end_time)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            throw core::DataUnavailableException("Cannot query candles: Not connected to database.");
        }
        if (bar_count <= 0) {
            return {};
        }

        std::string end_str = core::utils::timestampToString(end_time);
        logger->trace("Querying {} {} candles for {} up to '{}'", bar_count, interval, symbol, end_str);

        const char* sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM historical_candles
            WHERE symbol = ?
              AND interval = ?
              AND timestamp <= ?
            ORDER BY timestamp DESC
            LIMIT ?;
        )";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw core::DataUnavailableException(
                fmt::format("Failed to prepare candle query [{}]: {}", rc, sqlite3_errmsg(db_)));
        }

        sqlite3_bind_text(guard.stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 3, end_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(guard.stmt, 4, bar_count);

        core::TimeSeries<core::Candle> candles;
        candles.reserve(static_cast<size_t>(bar_count));
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
            const unsigned char *ts_text = sqlite3_column_text(guard.stmt, 0);
            if (!ts_text) {
                logger->warn("NULL timestamp found for {}, skipping row.", symbol);
                continue;
            }

            core::Candle candle;
            try {
                candle.timestamp = core::utils::stringToTimestamp(reinterpret_cast<const char*>(ts_text));
            } catch (const std::runtime_error& e) {
                logger->warn("Skipping {} row with bad timestamp: {}", symbol, e.what());
                continue;
            }
            candle.open = sqlite3_column_double(guard.stmt, 1);
            candle.high = sqlite3_column_double(guard.stmt, 2);
            candle.low = sqlite3_column_double(guard.stmt, 3);
            candle.close = sqlite3_column_double(guard.stmt, 4);
            candle.volume = sqlite3_column_int64(guard.stmt, 5);
            candles.push_back(candle);
        }

        if (rc != SQLITE_DONE) {
            throw core::DataUnavailableException(
                fmt::format("Error stepping through candle query for {} [{}]: {}", symbol, rc, sqlite3_errmsg(db_)));
        }

        std::reverse(candles.begin(), candles.end()); // Oldest first
        logger->trace("Loaded {} candles for {}", candles.size(), symbol);
        return candles;
    }

    std::optional<core::Timestamp> DatabaseManager::queryLatestTimestamp(
        const std::string& symbol,
        const std::string& interval)
    {
        if (!isConnected()) {
            throw core::DataUnavailableException("Cannot query latest timestamp: Not connected to database.");
        }

        const char* sql = "SELECT MAX(timestamp) FROM historical_candles WHERE symbol = ? AND interval = ?;";
        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw core::DataUnavailableException(
                fmt::format("Failed to prepare latest timestamp query [{}]: {}", rc, sqlite3_errmsg(db_)));
        }
        sqlite3_bind_text(guard.stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);

        rc = sqlite3_step(guard.stmt);
        if (rc != SQLITE_ROW) {
            throw core::DataUnavailableException(
                fmt::format("Latest timestamp query for {} failed [{}]: {}", symbol, rc, sqlite3_errmsg(db_)));
        }
        const unsigned char *ts_text = sqlite3_column_text(guard.stmt, 0);
        if (!ts_text) {
            return std::nullopt;
        }
        return core::utils::stringToTimestamp(reinterpret_cast<const char*>(ts_text));
    }

    std::vector<std::string> DatabaseManager::queryConstituents(const std::string& index_key)
    {
        if (!isConnected()) {
            throw core::DataUnavailableException("Cannot query constituents: Not connected to database.");
        }

        const char* sql = R"(
            SELECT constituent_key
            FROM index_constituents
            WHERE index_key = ?
              AND as_of_date = (SELECT MAX(as_of_date) FROM index_constituents WHERE index_key = ?)
            ORDER BY constituent_key ASC;
        )";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw core::DataUnavailableException(
                fmt::format("Failed to prepare constituents query [{}]: {}", rc, sqlite3_errmsg(db_)));
        }
        sqlite3_bind_text(guard.stmt, 1, index_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 2, index_key.c_str(), -1, SQLITE_TRANSIENT);

        std::vector<std::string> symbols;
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
            const unsigned char *text = sqlite3_column_text(guard.stmt, 0);
            if (text) symbols.emplace_back(reinterpret_cast<const char*>(text));
        }
        if (rc != SQLITE_DONE) {
            throw core::DataUnavailableException(
                fmt::format("Error reading constituents of '{}' [{}]: {}", index_key, rc, sqlite3_errmsg(db_)));
        }
        return symbols;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                      const std::string &symbol,
                                      const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            return true; // Nothing to do
        }

        // Duplicates on (symbol, interval, timestamp) are replaced by the newer bar
        const char *sql = R"(
INSERT OR REPLACE INTO historical_candles
(symbol, interval, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving candles.");
            return false;
        }

        bool success = true;
        for (const auto &candle : candles)
        {
            std::string timestamp_str = core::utils::timestampToString(candle.timestamp);
            sqlite3_bind_text(guard.stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(guard.stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(guard.stmt, 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(guard.stmt, 4, candle.open);
            sqlite3_bind_double(guard.stmt, 5, candle.high);
            sqlite3_bind_double(guard.stmt, 6, candle.low);
            sqlite3_bind_double(guard.stmt, 7, candle.close);
            sqlite3_bind_int64(guard.stmt, 8, candle.volume);

            rc = sqlite3_step(guard.stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            sqlite3_reset(guard.stmt);
        }

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            logger->error("Failed to {} transaction for saving candles.", success ? "COMMIT" : "ROLLBACK");
            return false;
        }
        if (success)
        {
            logger->debug("Saved {} candles for {} ({}).", candles.size(), symbol, interval);
        }
        return success;
    }

    bool DatabaseManager::saveConstituents(const std::string& index_key,
                                           const std::vector<std::string>& symbols,
                                           const std::string& as_of_date)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot save constituents: Not connected to database.");
            return false;
        }

        const char *sql = "INSERT OR IGNORE INTO index_constituents (index_key, constituent_key, as_of_date) VALUES (?, ?, ?);";
        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Failed to prepare constituents INSERT [{}]: {}", rc, sqlite3_errmsg(db_));
            return false;
        }

        for (const auto& symbol : symbols)
        {
            sqlite3_bind_text(guard.stmt, 1, index_key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(guard.stmt, 2, symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(guard.stmt, 3, as_of_date.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(guard.stmt) != SQLITE_DONE)
            {
                core::logging::getLogger()->error("Failed to insert constituent {} of '{}': {}", symbol, index_key, sqlite3_errmsg(db_));
                return false;
            }
            sqlite3_reset(guard.stmt);
        }
        return true;
    }

} // namespace data
