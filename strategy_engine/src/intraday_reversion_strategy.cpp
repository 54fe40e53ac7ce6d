#include "intraday_reversion_strategy.hpp"
#include "ranking.hpp"
#include "utils.hpp"
#include "logging.hpp"

namespace strategy_engine {

IntradayReversionStrategy::IntradayReversionStrategy(StrategyConfig config) : Strategy(std::move(config)) {
    setEntryRule(buildFilterConditions());
}

std::vector<OrderIntent> IntradayReversionStrategy::evaluateSnapshots(const std::vector<MarketDataSnapshot>& snapshots,
                                                                      const StrategyInputs& inputs) const {
    auto logger = core::logging::getLogger();
    if (!entriesEnabled(inputs)) {
        return {};
    }

    auto held = heldPositions(inputs);
    std::string good_till = core::utils::goodTillDate(inputs.now, config_.gtd_hour, config_.gtd_minute);
    logger->info("{}: GTD time {}", config_.id, good_till);

    std::vector<RankedCandidate> candidates;
    for (const auto& snapshot : snapshots) {
        if (held.count(snapshot.symbol) > 0 || entryExcluded(inputs, snapshot.symbol)) continue;
        if (!passesEntryRule(snapshot)) continue;
        candidates.push_back(RankedCandidate{snapshot.symbol, snapshot.get("Volatility").value_or(0.0), snapshot});
    }
    rankCandidates(candidates);
    logger->info("{}: {} qualified, taking top {}", config_.id, candidates.size(), config_.max_positions);

    std::vector<OrderIntent> intents;
    for (const auto& candidate : candidates) {
        if (static_cast<int>(intents.size()) >= config_.max_positions) break;
        auto entry = buildLimitEntry(candidate.snapshot, candidate.score, inputs.budget);
        if (!entry) continue;
        if (config_.entry_time_in_force == TimeInForce::Gtd) {
            entry->good_till_date = good_till;
        }
        logger->info("{}: ENTRY {} x{} @ {:.2f} limit (IBR {:.3f}, volatility {:.3f})",
                     config_.id, entry->symbol, entry->quantity, entry->limit_price,
                     candidate.snapshot.get("IBR").value_or(0.5), candidate.score);
        intents.push_back(*entry);
    }
    return intents;
}

} // namespace strategy_engine
