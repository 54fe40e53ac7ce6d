#include "sqlite_market_data_provider.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

namespace data {

namespace {
    const char* const kDailyInterval = "day";
}

SqliteMarketDataProvider::SqliteMarketDataProvider(const std::string& db_path) : db_(db_path) {
    if (!db_.connect()) {
        throw core::DataUnavailableException("Cannot open market data database: " + db_path);
    }
    if (!db_.initializeSchema()) {
        throw core::DataUnavailableException("Cannot initialize market data schema in: " + db_path);
    }
}

core::TimeSeries<core::Candle> SqliteMarketDataProvider::getBars(const std::string& symbol,
                                                                 int bar_count,
                                                                 const core::Date& end_date) {
    // Daily bars are stamped at or before the end of their UTC day
    core::Timestamp end_time = core::utils::stringToTimestamp(
        core::utils::dateToString(end_date) + "T23:59:59+00:00");

    auto bars = db_.queryRecentCandles(symbol, kDailyInterval, bar_count, end_time);
    if (bars.empty()) {
        throw core::DataUnavailableException(fmt::format(
            "No daily bars for {} on or before {}", symbol, core::utils::dateToString(end_date)));
    }
    return bars;
}

std::vector<std::string> SqliteMarketDataProvider::getUniverse(const std::string& name) {
    auto symbols = db_.queryConstituents(name);
    if (symbols.empty()) {
        throw core::DataUnavailableException("Unknown or empty universe: " + name);
    }
    core::logging::getLogger()->debug("Universe '{}' has {} members", name, symbols.size());
    return symbols;
}

std::optional<core::Date> SqliteMarketDataProvider::latestBarDate(const std::string& symbol) {
    auto latest = db_.queryLatestTimestamp(symbol, kDailyInterval);
    if (!latest) return std::nullopt;
    return core::utils::parseDate(core::utils::timestampToString(*latest).substr(0, 10));
}

} // namespace data
