#pragma once

#include "market_data_provider.hpp"
#include "database_manager.hpp"
#include <string>

namespace data {

    // IMarketDataProvider over the local SQLite store (interval "day")
    class SqliteMarketDataProvider : public IMarketDataProvider {
    public:
        // Opens the database. Throws core::DataUnavailableException on failure.
        explicit SqliteMarketDataProvider(const std::string& db_path);

        core::TimeSeries<core::Candle> getBars(const std::string& symbol,
                                               int bar_count,
                                               const core::Date& end_date) override;
        std::vector<std::string> getUniverse(const std::string& name) override;
        std::optional<core::Date> latestBarDate(const std::string& symbol) override;

        DatabaseManager& database() { return db_; }

    private:
        DatabaseManager db_;
    };

} // namespace data
