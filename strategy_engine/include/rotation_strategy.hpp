#pragma once

#include "strategy.hpp"

namespace strategy_engine {

    // Monthly momentum rotation (momo, growth, def).
    // Ranks qualifying symbols by a weighted sum of two rates of change and
    // rotates with hysteresis: held symbols stay while ranked within worst_rank,
    // new entries come from the top max_positions.
    class RotationStrategy : public Strategy {
    public:
        explicit RotationStrategy(StrategyConfig config);

        std::vector<OrderIntent> evaluateSnapshots(const std::vector<MarketDataSnapshot>& snapshots,
                                                   const StrategyInputs& inputs) const override;
    };

} // namespace strategy_engine
