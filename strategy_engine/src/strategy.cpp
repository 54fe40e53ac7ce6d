#include "strategy.hpp"
#include "indicator_condition.hpp"
#include "sma_indicator.hpp"
#include "ema_indicator.hpp"
#include "rsi_indicator.hpp"
#include "roc_indicator.hpp"
#include "adx_indicator.hpp"
#include "atr_indicator.hpp"
#include "price_utils.hpp"
#include "exceptions.hpp"
#include "logging.hpp" // Use short path
#include <spdlog/fmt/fmt.h>
#include <stdexcept>  // For std::invalid_argument
#include <algorithm>
#include <cmath>
#include <set>
#include <cstdlib>

namespace strategy_engine {

namespace {

    // Consecutive values > 0 counted back from the latest bar
    double trailingPositiveCount(const indicators::IndicatorSeries& series) {
        double count = 0.0;
        for (auto it = series.rbegin(); it != series.rend(); ++it) {
            if (!it->has_value() || **it <= 0.0) break;
            count += 1.0;
        }
        return count;
    }

} // end anonymous namespace

Strategy::Strategy(StrategyConfig config) : config_(std::move(config)) {
    if (config_.id.empty()) throw std::invalid_argument("Strategy name cannot be empty.");
    if (config_.max_positions < 1) throw std::invalid_argument("Strategy must allow at least one position.");

    if (config_.trend_sma_period > 0) names_.trend_sma = indicators::SmaIndicator(config_.trend_sma_period).getName();
    if (config_.volume_period > 0) {
        names_.avg_volume = config_.volume_uses_ema
            ? indicators::EmaIndicator(config_.volume_period, indicators::Source::Volume).getName()
            : indicators::SmaIndicator(config_.volume_period, indicators::Source::Volume).getName();
    }
    if (config_.adx_period > 0) names_.adx = indicators::AdxIndicator(config_.adx_period).getName();
    if (config_.rsi_period > 0) names_.rsi = indicators::RsiIndicator(config_.rsi_period).getName();
    if (config_.atr_period > 0) names_.atr = indicators::AtrIndicator(config_.atr_period).getName();
    if (config_.roc_period_fast > 0) names_.roc_fast = indicators::RocIndicator(config_.roc_period_fast).getName();
    if (config_.roc_period_slow > 0) names_.roc_slow = indicators::RocIndicator(config_.roc_period_slow).getName();
    if (config_.trend_roc_period > 0) names_.trend_roc = indicators::RocIndicator(config_.trend_roc_period).getName();

    core::logging::getLogger()->debug("Strategy '{}' ({}) created.", config_.id, toString(config_.kind));
}

std::string Strategy::getName() const { return config_.id; }
const StrategyConfig& Strategy::getConfig() const { return config_; }

const Rule& Strategy::getEntryRule() const {
    if (!entry_rule_) {
        throw core::StrategyException(fmt::format("Strategy '{}' has no entry rule.", config_.id));
    }
    return *entry_rule_;
}

std::vector<std::unique_ptr<indicators::IIndicator>> Strategy::createIndicators() const {
    std::vector<std::unique_ptr<indicators::IIndicator>> list;
    if (config_.trend_sma_period > 0) list.push_back(std::make_unique<indicators::SmaIndicator>(config_.trend_sma_period));
    if (config_.volume_period > 0) {
        if (config_.volume_uses_ema) {
            list.push_back(std::make_unique<indicators::EmaIndicator>(config_.volume_period, indicators::Source::Volume));
        } else {
            list.push_back(std::make_unique<indicators::SmaIndicator>(config_.volume_period, indicators::Source::Volume));
        }
    }
    if (config_.adx_period > 0) list.push_back(std::make_unique<indicators::AdxIndicator>(config_.adx_period));
    if (config_.rsi_period > 0) list.push_back(std::make_unique<indicators::RsiIndicator>(config_.rsi_period));
    if (config_.atr_period > 0) list.push_back(std::make_unique<indicators::AtrIndicator>(config_.atr_period));
    if (config_.roc_period_fast > 0) list.push_back(std::make_unique<indicators::RocIndicator>(config_.roc_period_fast));
    if (config_.roc_period_slow > 0 && config_.roc_period_slow != config_.roc_period_fast) {
        list.push_back(std::make_unique<indicators::RocIndicator>(config_.roc_period_slow));
    }
    if (config_.trend_roc_period > 0 && config_.trend_roc_period != config_.roc_period_fast &&
        config_.trend_roc_period != config_.roc_period_slow) {
        list.push_back(std::make_unique<indicators::RocIndicator>(config_.trend_roc_period));
    }
    return list;
}

MarketDataSnapshot Strategy::buildSnapshot(const std::string& symbol,
                                           const core::TimeSeries<core::Candle>& bars) const {
    if (bars.empty()) {
        throw core::DataUnavailableException(fmt::format("No bars for {}", symbol));
    }

    MarketDataSnapshot snapshot;
    snapshot.symbol = symbol;
    snapshot.bar_count = bars.size();
    snapshot.current_candle = bars.back();
    snapshot.current_time = bars.back().timestamp;

    const core::Candle& latest = bars.back();
    snapshot.indicator_values["Open"] = latest.open;
    snapshot.indicator_values["High"] = latest.high;
    snapshot.indicator_values["Low"] = latest.low;
    snapshot.indicator_values["Close"] = latest.close;
    snapshot.indicator_values["Volume"] = static_cast<double>(latest.volume);

    std::map<std::string, indicators::IndicatorSeries> series;
    for (auto& indicator : createIndicators()) {
        indicator->calculate(bars);
        if (auto value = indicators::latestValue(*indicator)) {
            snapshot.indicator_values[indicator->getName()] = *value;
        }
        series[indicator->getName()] = indicator->getResult();
    }

    addDerivedValues(snapshot, series);
    return snapshot;
}

void Strategy::addDerivedValues(MarketDataSnapshot& snapshot,
                                const std::map<std::string, indicators::IndicatorSeries>& series) const {
    const core::Candle& latest = snapshot.current_candle;
    snapshot.indicator_values["IBR"] = indicators::ibr(latest);

    if (!names_.atr.empty()) {
        auto atr = snapshot.get(names_.atr);
        if (atr && latest.close > 0.0) {
            snapshot.indicator_values["Volatility"] = *atr / latest.close * 100.0;
        }
    }

    // Rotation score series: weighted sum of the two ROCs wherever both exist
    if (!names_.roc_fast.empty() && !names_.roc_slow.empty()) {
        const auto& fast = series.at(names_.roc_fast);
        const auto& slow = series.at(names_.roc_slow);
        indicators::IndicatorSeries score(fast.size(), std::nullopt);
        for (std::size_t i = 0; i < fast.size() && i < slow.size(); ++i) {
            if (fast[i] && slow[i]) {
                score[i] = config_.roc_weight_fast * *fast[i] + config_.roc_weight_slow * *slow[i];
            }
        }
        if (auto latest_score = indicators::latestValue(score)) {
            snapshot.indicator_values["Score"] = *latest_score;
        }
        snapshot.indicator_values["ScorePositiveBars"] = trailingPositiveCount(score);
    }

    if (!names_.trend_roc.empty()) {
        snapshot.indicator_values["UptrendBars"] = trailingPositiveCount(series.at(names_.trend_roc));
    }
}

std::vector<std::unique_ptr<ICondition>> Strategy::buildFilterConditions() const {
    const bool is_long = config_.side == core::Side::Long;
    std::vector<std::unique_ptr<ICondition>> conditions;

    const ComparisonOp above = config_.price_band_inclusive ? ComparisonOp::GTE : ComparisonOp::GT;
    const ComparisonOp below = config_.price_band_inclusive ? ComparisonOp::LTE : ComparisonOp::LT;
    if (config_.min_price > 0.0) {
        conditions.push_back(std::make_unique<IndicatorCondition>("Close", above, config_.min_price));
    }
    if (config_.max_price > 0.0) {
        conditions.push_back(std::make_unique<IndicatorCondition>("Close", below, config_.max_price));
    }
    if (!names_.avg_volume.empty()) {
        conditions.push_back(std::make_unique<IndicatorCondition>(names_.avg_volume, ComparisonOp::GT, config_.min_avg_volume));
    }
    if (!names_.trend_sma.empty()) {
        conditions.push_back(std::make_unique<IndicatorCondition>("Close", ComparisonOp::GT, names_.trend_sma));
    }
    if (!names_.adx.empty()) {
        conditions.push_back(std::make_unique<IndicatorCondition>(names_.adx, ComparisonOp::GT, config_.adx_threshold));
    }
    if (!names_.rsi.empty()) {
        conditions.push_back(std::make_unique<IndicatorCondition>(
            names_.rsi, is_long ? ComparisonOp::LT : ComparisonOp::GT, config_.rsi_threshold));
    }
    if (config_.ibr_threshold) {
        conditions.push_back(std::make_unique<IndicatorCondition>(
            "IBR", is_long ? ComparisonOp::LT : ComparisonOp::GT, *config_.ibr_threshold));
    }
    if (!names_.atr.empty()) {
        conditions.push_back(std::make_unique<IndicatorCondition>("Volatility", ComparisonOp::GT, 0.0));
    }
    return conditions;
}

void Strategy::setEntryRule(std::vector<std::unique_ptr<ICondition>> conditions) {
    auto condition = std::make_unique<AndCondition>(std::move(conditions));
    entry_condition_ = condition.get();
    entry_rule_ = std::make_unique<Rule>(config_.id + " entry", std::move(condition), entryAction());
    core::logging::getLogger()->debug("{}", entry_rule_->describe());
}

bool Strategy::passesEntryRule(const MarketDataSnapshot& snapshot) const {
    auto logger = core::logging::getLogger();
    if (snapshot.bar_count < static_cast<std::size_t>(config_.min_bars)) {
        logger->debug("{}: {} excluded, {} bars < {}", config_.id, snapshot.symbol, snapshot.bar_count, config_.min_bars);
        return false;
    }

    core::SignalAction action = getEntryRule().evaluate(snapshot);
    if (action == core::SignalAction::None) {
        auto failure = entry_condition_->firstFailure(snapshot);
        logger->debug("{}: {} excluded, failed '{}'", config_.id, snapshot.symbol, failure.value_or("?"));
        return false;
    }
    return true;
}

bool Strategy::entriesEnabled(const StrategyInputs& inputs) const {
    auto logger = core::logging::getLogger();
    if (!config_.entry_allowed) {
        logger->info("{}: new entries disabled by configuration.", config_.id);
        return false;
    }
    if (config_.use_market_filter && !inputs.market_gate_open) {
        logger->info("{}: market filter closed, new entries suppressed.", config_.id);
        return false;
    }
    return true;
}

bool Strategy::entryExcluded(const StrategyInputs& inputs, const std::string& symbol) const {
    if (inputs.excluded.count(symbol) == 0) return false;
    core::logging::getLogger()->debug("{}: {} is excluded from new entries", config_.id, symbol);
    return true;
}

std::map<std::string, long long> Strategy::heldPositions(const StrategyInputs& inputs) const {
    std::set<std::string> universe(inputs.universe.begin(), inputs.universe.end());
    std::map<std::string, long long> held;
    for (const auto& position : inputs.positions) {
        if (universe.count(position.symbol) == 0 || position.quantity == 0) continue;
        bool is_long = position.quantity > 0;
        if (is_long != (config_.side == core::Side::Long)) continue;
        held[position.symbol] += std::llabs(position.quantity);
    }
    return held;
}

long long Strategy::sizeFor(double budget, double reference_price) const {
    if (!std::isfinite(reference_price) || reference_price <= 0.0 || !std::isfinite(budget) || budget <= 0.0) {
        return 0;
    }
    return static_cast<long long>(std::floor(budget / config_.max_positions / reference_price));
}

std::optional<OrderIntent> Strategy::buildLimitEntry(const MarketDataSnapshot& snapshot, double score,
                                                     double budget) const {
    auto logger = core::logging::getLogger();
    auto atr = snapshot.get(names_.atr);
    if (!atr) {
        logger->debug("{}: {} has no {} value", config_.id, snapshot.symbol, names_.atr);
        return std::nullopt;
    }

    const core::Candle& latest = snapshot.current_candle;
    const double anchor = config_.side == core::Side::Long ? latest.low : latest.high;
    const double stretch = config_.entry_stretch * *atr;
    double raw_limit = config_.side == core::Side::Long ? anchor - stretch : anchor + stretch;
    // Tick follows the bar price the limit is stretched from
    double limit = indicators::roundToTick(raw_limit, indicators::tickSize(anchor));
    if (!std::isfinite(limit) || limit <= 0.0) {
        logger->debug("{}: {} limit {:.4f} not usable", config_.id, snapshot.symbol, raw_limit);
        return std::nullopt;
    }

    long long quantity = sizeFor(budget, limit);
    if (quantity < 1) {
        logger->debug("{}: {} dropped, budget too small for one share at {:.2f}", config_.id, snapshot.symbol, limit);
        return std::nullopt;
    }

    OrderIntent intent;
    intent.symbol = snapshot.symbol;
    intent.action = entryAction();
    intent.order_type = OrderType::Limit;
    intent.reference_price = limit;
    intent.limit_price = limit;
    intent.quantity = quantity;
    intent.time_in_force = config_.entry_time_in_force;
    intent.attach_moc = config_.attach_moc;
    intent.score = score;
    return intent;
}

core::SignalAction Strategy::entryAction() const {
    return config_.side == core::Side::Long ? core::SignalAction::EnterLong : core::SignalAction::EnterShort;
}

core::SignalAction Strategy::exitAction() const {
    return config_.side == core::Side::Long ? core::SignalAction::ExitLong : core::SignalAction::ExitShort;
}

const MarketDataSnapshot* Strategy::findSnapshot(const std::vector<MarketDataSnapshot>& snapshots,
                                                 const std::string& symbol) {
    auto it = std::find_if(snapshots.begin(), snapshots.end(),
                           [&symbol](const MarketDataSnapshot& s) { return s.symbol == symbol; });
    return it == snapshots.end() ? nullptr : &*it;
}

std::vector<OrderIntent> Strategy::evaluate(const StrategyInputs& inputs) const {
    auto logger = core::logging::getLogger();
    logger->info("Evaluating strategy '{}' over {} symbols (budget ${:.2f})",
                 config_.id, inputs.universe.size(), inputs.budget);

    std::vector<MarketDataSnapshot> snapshots;
    snapshots.reserve(inputs.universe.size());
    for (const auto& symbol : inputs.universe) {
        auto it = inputs.bars.find(symbol);
        if (it == inputs.bars.end()) {
            logger->debug("{}: no bars for {}, skipped.", config_.id, symbol);
            continue;
        }
        try {
            snapshots.push_back(buildSnapshot(symbol, it->second));
        } catch (const core::DataUnavailableException& e) {
            logger->debug("{}: {} skipped: {}", config_.id, symbol, e.what());
        } catch (const core::IndicatorCalculationException& e) {
            logger->warn("{}: indicator failure for {}: {}", config_.id, symbol, e.what());
        }
    }

    std::vector<OrderIntent> intents = evaluateSnapshots(snapshots, inputs);
    logger->info("Strategy '{}' produced {} intents.", config_.id, intents.size());
    return intents;
}

} // namespace strategy_engine
