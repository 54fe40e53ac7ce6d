#pragma once

#include "strategy.hpp"

namespace strategy_engine {

    // Short-horizon reversion (hft-long, hft-short). Entry limits stretched from
    // the latest bar, good till the configured US/Eastern time, with an
    // attached market-on-close exit.
    class IntradayReversionStrategy : public Strategy {
    public:
        explicit IntradayReversionStrategy(StrategyConfig config);

        std::vector<OrderIntent> evaluateSnapshots(const std::vector<MarketDataSnapshot>& snapshots,
                                                   const StrategyInputs& inputs) const override;
    };

} // namespace strategy_engine
