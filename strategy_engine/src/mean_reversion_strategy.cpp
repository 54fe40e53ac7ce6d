#include "mean_reversion_strategy.hpp"
#include "ranking.hpp"
#include "price_utils.hpp"
#include "logging.hpp"
#include <algorithm>

namespace strategy_engine {

MeanReversionStrategy::MeanReversionStrategy(StrategyConfig config) : Strategy(std::move(config)) {
    setEntryRule(buildFilterConditions());
}

std::vector<OrderIntent> MeanReversionStrategy::evaluateSnapshots(const std::vector<MarketDataSnapshot>& snapshots,
                                                                  const StrategyInputs& inputs) const {
    auto logger = core::logging::getLogger();
    const bool is_long = config_.side == core::Side::Long;
    auto held = heldPositions(inputs);
    std::vector<OrderIntent> intents;

    // Exits: one resting limit per held position
    for (const auto& [symbol, quantity] : held) {
        const MarketDataSnapshot* snapshot = findSnapshot(snapshots, symbol);
        if (!snapshot) {
            logger->warn("{}: no data for held {}, exit order not generated", config_.id, symbol);
            continue;
        }
        double price = indicators::roundToTick(is_long ? snapshot->current_candle.high
                                                       : snapshot->current_candle.low);
        OrderIntent exit;
        exit.symbol = symbol;
        exit.action = exitAction();
        exit.order_type = OrderType::Limit;
        exit.reference_price = price;
        exit.limit_price = price;
        exit.quantity = quantity;
        exit.time_in_force = TimeInForce::Gtc;
        logger->info("{}: EXIT {} x{} @ {:.2f} limit", config_.id, symbol, quantity, price);
        intents.push_back(exit);
    }

    if (!entriesEnabled(inputs)) {
        return intents;
    }

    std::vector<RankedCandidate> candidates;
    for (const auto& snapshot : snapshots) {
        if (held.count(snapshot.symbol) > 0 || entryExcluded(inputs, snapshot.symbol)) continue;
        if (!passesEntryRule(snapshot)) continue;
        candidates.push_back(RankedCandidate{snapshot.symbol, snapshot.get("Volatility").value_or(0.0), snapshot});
    }
    rankCandidates(candidates);

    int slots = std::max(0, config_.max_positions - static_cast<int>(held.size()));
    logger->info("{}: {} qualified, {} slots (held {}, max {})",
                 config_.id, candidates.size(), slots, held.size(), config_.max_positions);

    int added = 0;
    for (const auto& candidate : candidates) {
        if (added >= slots) break;
        auto entry = buildLimitEntry(candidate.snapshot, candidate.score, inputs.budget);
        if (!entry) continue;
        logger->info("{}: ENTRY {} x{} @ {:.2f} limit (volatility {:.3f})",
                     config_.id, entry->symbol, entry->quantity, entry->limit_price, candidate.score);
        intents.push_back(*entry);
        ++added;
    }
    return intents;
}

} // namespace strategy_engine
