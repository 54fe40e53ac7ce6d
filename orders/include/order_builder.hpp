#pragma once

#include "order_record.hpp"
#include "common_types.hpp"
#include "engine_config.hpp"
#include "signal_engine.hpp"
#include <optional>
#include <string>
#include <vector>

namespace orders {

    // Broker action string for a signal; throws std::invalid_argument for SignalAction::None
    std::string actionString(core::SignalAction action);

    // Limit price at the precision of its tick (2 decimals, 3 below one cent ticks)
    std::string formatPrice(double price);

    class OrderBuilder {
    public:
        // nullopt (logged) for quantity <= 0, a LIMIT without a positive price,
        // or an intent with no action
        static std::optional<OrderRecord> build(const strategy_engine::StrategyConfig& config,
                                                const strategy_engine::OrderIntent& intent);

        static std::vector<OrderRecord> build(const strategy_engine::StrategyConfig& config,
                                              const std::vector<strategy_engine::OrderIntent>& intents);

        // Records of every successful result, in result order. Failed results contribute nothing.
        static std::vector<OrderRecord> consolidate(const strategy_engine::EngineConfig& config,
                                                    const std::vector<strategy_engine::StrategyResult>& results);
    };

} // namespace orders
