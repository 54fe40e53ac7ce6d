#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp" // Keep core types

namespace data {

// Owns one SQLite connection to the market data store.
// Tables: historical_candles (OHLCV per symbol and interval) and
// index_constituents (named universe membership by as-of date).
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
        const std::string& symbol,
        const std::string& interval);

    bool saveConstituents(const std::string& index_key,
        const std::vector<std::string>& symbols,
        const std::string& as_of_date);

    // The last `bar_count` candles at or before end_time, oldest first.
    // Throws core::DataUnavailableException on SQLite errors.
    core::TimeSeries<core::Candle> queryRecentCandles(
        const std::string& symbol,
        const std::string& interval,
        int bar_count,
        core::Timestamp end_time);

    std::optional<core::Timestamp> queryLatestTimestamp(
        const std::string& symbol,
        const std::string& interval);

    // Members of index_key as of its most recent as_of_date, sorted
    std::vector<std::string> queryConstituents(const std::string& index_key);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
};

} // namespace data
