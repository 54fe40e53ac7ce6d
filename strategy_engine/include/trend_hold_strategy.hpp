#pragma once

#include "strategy.hpp"

namespace strategy_engine {

    // Single-asset trend follower (btc): long while ROC has been positive on
    // each of the last trend_bars bars, flat otherwise.
    class TrendHoldStrategy : public Strategy {
    public:
        explicit TrendHoldStrategy(StrategyConfig config);

        std::vector<OrderIntent> evaluateSnapshots(const std::vector<MarketDataSnapshot>& snapshots,
                                                   const StrategyInputs& inputs) const override;
    };

} // namespace strategy_engine
