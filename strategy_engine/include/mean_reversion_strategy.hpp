#pragma once

#include "strategy.hpp"

namespace strategy_engine {

    // Multi-day mean reversion (mr-long, mr-short) on liquid uptrending stocks.
    // Oversold (long) or overbought (short) symbols are bought below the low /
    // sold above the high with GTC limits. Every held position on the side gets
    // a GTC exit limit at the latest bar's high (long) or low (short).
    class MeanReversionStrategy : public Strategy {
    public:
        explicit MeanReversionStrategy(StrategyConfig config);

        std::vector<OrderIntent> evaluateSnapshots(const std::vector<MarketDataSnapshot>& snapshots,
                                                   const StrategyInputs& inputs) const override;
    };

} // namespace strategy_engine
