#include "signal_engine.hpp"
#include "market_condition_filter.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <stdexcept>

namespace strategy_engine {

    SignalEngine::SignalEngine(EngineConfig config, data::IMarketDataProvider& provider)
        : config_(std::move(config)), provider_(provider)
    {
        core::logging::getLogger()->debug("SignalEngine initialized with {} configured strategies.",
                                          config_.strategies.size());
    }

    core::Date SignalEngine::dataEndDate(const StrategyConfig& config, const core::Date& today) {
        return config.monthly_rebalance ? core::utils::monthlyRebalanceDate(today) : today;
    }

    std::vector<std::string> SignalEngine::resolveUniverse(const StrategyConfig& config) {
        std::vector<std::string> symbols;
        if (!config.universe_name.empty()) {
            auto it = universe_cache_.find(config.universe_name);
            if (it == universe_cache_.end()) {
                it = universe_cache_.emplace(config.universe_name, provider_.getUniverse(config.universe_name)).first;
            }
            symbols = it->second;
        } else {
            symbols = config.universe_symbols;
        }
        return symbols;
    }

    std::optional<core::TimeSeries<core::Candle>> SignalEngine::loadBars(const std::string& symbol,
                                                                         int bar_count,
                                                                         const core::Date& end_date) {
        auto key = std::make_pair(symbol, core::utils::dateToString(end_date));
        auto it = bar_cache_.find(key);
        if (it == bar_cache_.end() || it->second.requested < bar_count) {
            CachedBars entry;
            entry.requested = bar_count;
            try {
                entry.bars = provider_.getBars(symbol, bar_count, end_date);
                entry.available = true;
            } catch (const core::DataUnavailableException& e) {
                core::logging::getLogger()->debug("No data for {}: {}", symbol, e.what());
            }
            it = bar_cache_.insert_or_assign(key, std::move(entry)).first;
        }

        if (!it->second.available) return std::nullopt;

        const auto& cached = it->second.bars;
        if (cached.size() <= static_cast<std::size_t>(bar_count)) return cached;
        return core::TimeSeries<core::Candle>(cached.end() - bar_count, cached.end());
    }

    bool SignalEngine::marketGateOpen(const core::Date& end_date) {
        std::string key = core::utils::dateToString(end_date);
        auto cached = gate_cache_.find(key);
        if (cached != gate_cache_.end()) return cached->second;

        auto logger = core::logging::getLogger();
        const auto& gate = config_.market_gate;
        bool open = false;
        try {
            auto breadth = provider_.getBars(gate.symbol, gate.history_bars, end_date);
            open = MarketConditionFilter(gate.ma_period).isBullish(breadth);
        } catch (const core::SignalGeneratorException& e) {
            logger->warn("Market filter {} unavailable as of {} ({}); treating gate as closed.",
                         gate.symbol, key, e.what());
            open = false;
        }
        gate_cache_[key] = open;
        return open;
    }

    StrategyResult SignalEngine::runStrategy(const IStrategy& strategy,
                                             const std::map<std::string, double>& budgets,
                                             const std::vector<core::Position>& positions,
                                             core::Timestamp now,
                                             const core::Date& today) {
        auto logger = core::logging::getLogger();
        const StrategyConfig& config = strategy.getConfig();

        StrategyResult result;
        result.strategy = strategy.getName();

        auto budget = budgets.find(result.strategy);
        if (budget == budgets.end()) {
            throw core::StrategyException(fmt::format("No budget allocated to strategy '{}'", result.strategy));
        }

        core::Date end_date = dataEndDate(config, today);
        logger->info("Strategy '{}': data end date {}", result.strategy, core::utils::dateToString(end_date));

        StrategyInputs inputs;
        inputs.universe = resolveUniverse(config);
        inputs.budget = budget->second;
        inputs.positions = positions;
        inputs.excluded.insert(config_.excluded_symbols.begin(), config_.excluded_symbols.end());
        inputs.now = now;
        inputs.market_gate_open = config.use_market_filter ? marketGateOpen(end_date) : true;

        std::size_t missing = 0;
        for (const auto& symbol : inputs.universe) {
            auto bars = loadBars(symbol, config.history_bars, end_date);
            if (bars) {
                inputs.bars.emplace(symbol, std::move(*bars));
            } else {
                ++missing;
            }
        }
        if (missing > 0) {
            logger->info("Strategy '{}': {} of {} symbols have no data.", result.strategy, missing, inputs.universe.size());
        }

        result.intents = strategy.evaluate(inputs);
        result.ok = true;
        return result;
    }

    std::vector<StrategyResult> SignalEngine::run(const std::vector<std::unique_ptr<IStrategy>>& strategies,
                                                  const std::map<std::string, double>& budgets,
                                                  const std::vector<core::Position>& positions,
                                                  core::Timestamp now,
                                                  const core::Date& today) {
        auto logger = core::logging::getLogger();
        logger->info("========================================================");
        logger->info("Generating signals for {} ({} strategies)", core::utils::dateToString(today), strategies.size());
        logger->info("========================================================");

        std::vector<StrategyResult> results;
        results.reserve(strategies.size());
        for (const auto& strategy : strategies) {
            if (!strategy) continue;
            try {
                results.push_back(runStrategy(*strategy, budgets, positions, now, today));
            } catch (const core::SignalGeneratorException& e) {
                logger->error("Strategy '{}' failed: {}", strategy->getName(), e.what());
                results.push_back(StrategyResult{strategy->getName(), false, {}, e.what()});
            } catch (const std::exception& e) {
                logger->error("Strategy '{}' failed with unexpected error: {}", strategy->getName(), e.what());
                results.push_back(StrategyResult{strategy->getName(), false, {}, e.what()});
            }
        }

        std::size_t failed = std::count_if(results.begin(), results.end(),
                                           [](const StrategyResult& r) { return !r.ok; });
        logger->info("Signal generation finished: {} succeeded, {} failed.", results.size() - failed, failed);
        return results;
    }

} // namespace strategy_engine
