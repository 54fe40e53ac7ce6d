#include "market_condition_filter.hpp"
#include "sma_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

MarketConditionFilter::MarketConditionFilter(int ma_period) : ma_period_(ma_period) {
    if (ma_period_ < 2) {
        throw std::invalid_argument("Market filter MA period must be at least 2.");
    }
}

bool MarketConditionFilter::isBullish(const core::TimeSeries<core::Candle>& breadth) const {
    indicators::SmaIndicator sma(ma_period_);
    sma.calculate(breadth);

    auto average = indicators::latestValue(sma);
    if (breadth.empty() || !average) {
        throw core::IndicatorWarmupException(
            fmt::format("Market filter needs {} bars, got {}", ma_period_, breadth.size()));
    }

    double latest = breadth.back().close;
    bool bullish = latest > *average;
    core::logging::getLogger()->info("Market filter: {} (latest {:.2f} vs {} {:.2f})",
                                     bullish ? "BULLISH" : "BEARISH", latest, sma.getName(), *average);
    return bullish;
}

} // namespace strategy_engine
