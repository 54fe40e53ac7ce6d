#include "trend_hold_strategy.hpp"
#include "indicator_condition.hpp"
#include "logging.hpp"

namespace strategy_engine {

TrendHoldStrategy::TrendHoldStrategy(StrategyConfig config) : Strategy(std::move(config)) {
    auto conditions = buildFilterConditions();
    conditions.push_back(std::make_unique<IndicatorCondition>(
        "UptrendBars", ComparisonOp::GTE, static_cast<double>(config_.trend_bars)));
    setEntryRule(std::move(conditions));
}

std::vector<OrderIntent> TrendHoldStrategy::evaluateSnapshots(const std::vector<MarketDataSnapshot>& snapshots,
                                                              const StrategyInputs& inputs) const {
    auto logger = core::logging::getLogger();
    auto held = heldPositions(inputs);
    const bool can_enter = entriesEnabled(inputs);
    std::vector<OrderIntent> intents;

    for (const auto& snapshot : snapshots) {
        bool uptrend = passesEntryRule(snapshot);
        auto held_it = held.find(snapshot.symbol);
        double close = snapshot.current_candle.close;
        logger->info("{}: {} uptrend={} held={}", config_.id, snapshot.symbol, uptrend, held_it != held.end());

        if (uptrend && held_it == held.end()) {
            if (!can_enter || entryExcluded(inputs, snapshot.symbol)) continue;
            long long quantity = sizeFor(inputs.budget, close);
            if (quantity < 1) {
                logger->debug("{}: {} dropped, budget too small at {:.2f}", config_.id, snapshot.symbol, close);
                continue;
            }
            OrderIntent entry;
            entry.symbol = snapshot.symbol;
            entry.action = entryAction();
            entry.order_type = OrderType::Market;
            entry.reference_price = close;
            entry.quantity = quantity;
            entry.time_in_force = TimeInForce::Day;
            intents.push_back(entry);
        } else if (!uptrend && held_it != held.end()) {
            OrderIntent exit;
            exit.symbol = snapshot.symbol;
            exit.action = exitAction();
            exit.order_type = OrderType::Market;
            exit.reference_price = close;
            exit.quantity = held_it->second;
            exit.time_in_force = TimeInForce::Day;
            intents.push_back(exit);
        }
    }
    return intents;
}

} // namespace strategy_engine
