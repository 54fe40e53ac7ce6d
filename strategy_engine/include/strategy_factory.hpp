#pragma once

#include "engine_config.hpp"
#include "interfaces.hpp"
#include <memory>
#include <vector>

namespace strategy_engine {

    // Maps a StrategyKind onto its implementation:
    //   Momentum, Growth, Defensive        -> RotationStrategy
    //   Bitcoin                            -> TrendHoldStrategy
    //   MeanReversionLong/Short            -> MeanReversionStrategy
    //   HftLong/Short                      -> IntradayReversionStrategy
    // Invalid parameters surface as core::ConfigException.
    class StrategyFactory {
    public:
        static std::unique_ptr<IStrategy> createStrategy(const StrategyConfig& config);
        static std::unique_ptr<IStrategy> createStrategy(const json& config);

        // Configuration order is preserved
        static std::vector<std::unique_ptr<IStrategy>> createStrategies(const EngineConfig& config);
    };

} // namespace strategy_engine
