#pragma once

#include "datatypes.hpp"
#include <string>
#include <vector>
#include <optional>

namespace data {

    // Read-only source of daily bars and named universes
    class IMarketDataProvider {
    public:
        virtual ~IMarketDataProvider() = default;

        // The last bar_count daily bars ending on or before end_date, oldest first.
        // Throws core::DataUnavailableException when nothing is stored for the symbol.
        virtual core::TimeSeries<core::Candle> getBars(const std::string& symbol,
                                                       int bar_count,
                                                       const core::Date& end_date) = 0;

        // Members of a named universe (e.g. "S&P 500"). Throws core::DataUnavailableException when unknown.
        virtual std::vector<std::string> getUniverse(const std::string& name) = 0;

        virtual std::optional<core::Date> latestBarDate(const std::string& symbol) = 0;

        // Throws core::DataUnavailableException when the newest bar of `symbol`
        // is older than the trading day before `today`.
        void checkFreshness(const std::string& symbol, const core::Date& today);
    };

} // namespace data
