#include "market_data_provider.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

namespace data {

void IMarketDataProvider::checkFreshness(const std::string& symbol, const core::Date& today) {
    auto latest = latestBarDate(symbol);
    if (!latest) {
        throw core::DataUnavailableException(fmt::format("No bars stored for {}", symbol));
    }

    core::Date expected = core::utils::previousTradingDay(today);
    if (*latest < expected) {
        throw core::DataUnavailableException(fmt::format(
            "Market data is stale: latest {} bar is {}, expected {} or later",
            symbol, core::utils::dateToString(*latest), core::utils::dateToString(expected)));
    }
    core::logging::getLogger()->debug("Market data fresh: latest {} bar {}", symbol,
                                      core::utils::dateToString(*latest));
}

} // namespace data
