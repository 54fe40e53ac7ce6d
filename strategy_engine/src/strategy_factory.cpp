#include "strategy_factory.hpp"
#include "rotation_strategy.hpp"
#include "trend_hold_strategy.hpp"
#include "mean_reversion_strategy.hpp"
#include "intraday_reversion_strategy.hpp"
#include "logging.hpp"            // Use short path
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

#include <stdexcept>              // For std::invalid_argument

namespace strategy_engine {

    std::unique_ptr<IStrategy> StrategyFactory::createStrategy(const StrategyConfig& config) {
        auto logger = core::logging::getLogger();
        logger->debug("Creating strategy '{}' of kind {}", config.id, toString(config.kind));

        try {
            switch (config.kind) {
                case StrategyKind::Momentum:
                case StrategyKind::Growth:
                case StrategyKind::Defensive:
                    return std::make_unique<RotationStrategy>(config);
                case StrategyKind::Bitcoin:
                    return std::make_unique<TrendHoldStrategy>(config);
                case StrategyKind::MeanReversionLong:
                case StrategyKind::MeanReversionShort:
                    return std::make_unique<MeanReversionStrategy>(config);
                case StrategyKind::HftLong:
                case StrategyKind::HftShort:
                    return std::make_unique<IntradayReversionStrategy>(config);
            }
        } catch (const std::invalid_argument& e) {
            throw core::ConfigException(fmt::format("Invalid configuration for strategy '{}': {}", config.id, e.what()));
        }
        throw core::ConfigException(fmt::format("Unhandled strategy kind for '{}'", config.id));
    }

    std::unique_ptr<IStrategy> StrategyFactory::createStrategy(const json& config) {
        return createStrategy(parseStrategyConfig(config));
    }

    std::vector<std::unique_ptr<IStrategy>> StrategyFactory::createStrategies(const EngineConfig& config) {
        std::vector<std::unique_ptr<IStrategy>> strategies;
        strategies.reserve(config.strategies.size());
        for (const auto& strategy_config : config.strategies) {
            strategies.push_back(createStrategy(strategy_config));
        }
        core::logging::getLogger()->info("Created {} strategies.", strategies.size());
        return strategies;
    }

} // namespace strategy_engine
