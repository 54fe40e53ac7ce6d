#pragma once

#include "datatypes.hpp"

namespace strategy_engine {

    // Market regime gate: bullish when the latest breadth value (e.g. NYSE
    // highs minus lows) is above its simple moving average. Stateless.
    class MarketConditionFilter {
    public:
        explicit MarketConditionFilter(int ma_period);

        // Throws core::IndicatorWarmupException when the series is shorter than the period
        bool isBullish(const core::TimeSeries<core::Candle>& breadth) const;

        int getPeriod() const { return ma_period_; }

    private:
        int ma_period_;
    };

} // namespace strategy_engine
