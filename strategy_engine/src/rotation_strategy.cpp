#include "rotation_strategy.hpp"
#include "indicator_condition.hpp"
#include "ranking.hpp"
#include "logging.hpp"
#include <spdlog/fmt/ranges.h>
#include <algorithm>

namespace strategy_engine {

RotationStrategy::RotationStrategy(StrategyConfig config) : Strategy(std::move(config)) {
    auto conditions = buildFilterConditions();
    conditions.push_back(std::make_unique<IndicatorCondition>("Score", ComparisonOp::GT, 0.0));
    if (config_.since_true > 0) {
        conditions.push_back(std::make_unique<IndicatorCondition>(
            "ScorePositiveBars", ComparisonOp::GTE, static_cast<double>(config_.since_true)));
    }
    setEntryRule(std::move(conditions));
}

std::vector<OrderIntent> RotationStrategy::evaluateSnapshots(const std::vector<MarketDataSnapshot>& snapshots,
                                                             const StrategyInputs& inputs) const {
    auto logger = core::logging::getLogger();

    std::vector<RankedCandidate> candidates;
    for (const auto& snapshot : snapshots) {
        if (!passesEntryRule(snapshot)) continue;
        candidates.push_back(RankedCandidate{snapshot.symbol, snapshot.get("Score").value_or(0.0), snapshot});
    }
    rankCandidates(candidates);

    HysteresisSelection selection = selectWithHysteresis(candidates, config_.max_positions, config_.worst_rank);
    logger->info("{}: {} qualified. Top {}: [{}]. Hold buffer (top {}): [{}]",
                 config_.id, candidates.size(), config_.max_positions, fmt::join(selection.entries, ", "),
                 config_.worst_rank, fmt::join(selection.hold, ", "));

    auto held = heldPositions(inputs);
    std::vector<OrderIntent> intents;

    for (const auto& [symbol, quantity] : held) {
        if (std::find(selection.hold.begin(), selection.hold.end(), symbol) != selection.hold.end()) {
            logger->debug("{}: keeping {} (within top {})", config_.id, symbol, config_.worst_rank);
            continue;
        }
        OrderIntent exit;
        exit.symbol = symbol;
        exit.action = exitAction();
        exit.order_type = OrderType::Market;
        exit.quantity = quantity;
        exit.time_in_force = TimeInForce::Day;
        if (const auto* snapshot = findSnapshot(snapshots, symbol)) {
            exit.reference_price = snapshot->current_candle.close;
        }
        logger->info("{}: EXIT {} x{} (no longer in top {})", config_.id, symbol, quantity, config_.worst_rank);
        intents.push_back(exit);
    }

    if (!entriesEnabled(inputs)) {
        return intents;
    }

    for (const auto& candidate : candidates) {
        if (std::find(selection.entries.begin(), selection.entries.end(), candidate.symbol) == selection.entries.end()) {
            break; // Candidates are ranked, entries are a prefix
        }
        if (held.count(candidate.symbol) > 0 || entryExcluded(inputs, candidate.symbol)) continue;

        double close = candidate.snapshot.current_candle.close;
        long long quantity = sizeFor(inputs.budget, close);
        if (quantity < 1) {
            logger->debug("{}: {} dropped, budget too small for one share at {:.2f}", config_.id, candidate.symbol, close);
            continue;
        }

        OrderIntent entry;
        entry.symbol = candidate.symbol;
        entry.action = entryAction();
        entry.order_type = OrderType::Market;
        entry.reference_price = close;
        entry.quantity = quantity;
        entry.time_in_force = TimeInForce::Day;
        entry.score = candidate.score;
        logger->info("{}: ENTRY {} x{} @ market (score {:.4f})", config_.id, candidate.symbol, quantity, candidate.score);
        intents.push_back(entry);
    }
    return intents;
}

} // namespace strategy_engine
