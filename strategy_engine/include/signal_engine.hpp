#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <utility>

// Required project headers (use short paths)
#include "datatypes.hpp"
#include "interfaces.hpp"
#include "engine_config.hpp"
#include "market_data_provider.hpp"

namespace strategy_engine {

    // Outcome of one strategy: its intents, or the reason it produced none
    struct StrategyResult {
        std::string strategy;
        bool ok = false;
        std::vector<OrderIntent> intents;
        std::string error;
    };

    // Runs every strategy against one consistent view of market data.
    // Bars are fetched once per (symbol, data end date) and shared between strategies.
    // A failing strategy yields a failed StrategyResult; the others still run.
    class SignalEngine {
    public:
        // The provider is borrowed and must outlive the engine
        SignalEngine(EngineConfig config, data::IMarketDataProvider& provider);

        // One result per strategy, in the order given.
        // budgets: strategy id -> allocated capital.
        std::vector<StrategyResult> run(const std::vector<std::unique_ptr<IStrategy>>& strategies,
                                        const std::map<std::string, double>& budgets,
                                        const std::vector<core::Position>& positions,
                                        core::Timestamp now,
                                        const core::Date& today);

        // Last-Friday rule for monthly strategies, otherwise today
        static core::Date dataEndDate(const StrategyConfig& config, const core::Date& today);

        // Named universe via the provider, or the explicit list. Excluded symbols stay
        // in so held ones can be exited; strategies skip them for entries.
        std::vector<std::string> resolveUniverse(const StrategyConfig& config);

        // Breadth gate as of end_date. Closed (with a warning) when the series is
        // unavailable or too short.
        bool marketGateOpen(const core::Date& end_date);

    private:
        StrategyResult runStrategy(const IStrategy& strategy,
                                   const std::map<std::string, double>& budgets,
                                   const std::vector<core::Position>& positions,
                                   core::Timestamp now,
                                   const core::Date& today);

        // Cached bars, trimmed to the last bar_count. nullopt when unavailable.
        std::optional<core::TimeSeries<core::Candle>> loadBars(const std::string& symbol,
                                                               int bar_count,
                                                               const core::Date& end_date);

        EngineConfig config_;
        data::IMarketDataProvider& provider_; // Use reference, doesn't own it

        struct CachedBars {
            int requested = 0;
            core::TimeSeries<core::Candle> bars;
            bool available = false;
        };
        std::map<std::pair<std::string, std::string>, CachedBars> bar_cache_; // (symbol, end date)
        std::map<std::string, std::vector<std::string>> universe_cache_;
        std::map<std::string, bool> gate_cache_; // end date -> open
    };

} // namespace strategy_engine
