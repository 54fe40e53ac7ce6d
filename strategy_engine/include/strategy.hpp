#pragma once

#include "interfaces.hpp" // Includes IRule, IStrategy, MarketDataSnapshot etc.
#include "engine_config.hpp"
#include "and_condition.hpp"
#include "rule.hpp"
#include "indicators.hpp"
#include <string>
#include <vector>
#include <memory>      // For std::unique_ptr
#include <map>
#include <optional>

namespace strategy_engine {

    // --- Strategy Class ---
    // Shared machinery for all variants: snapshot construction from the
    // configured indicators, the entry rule, held-position lookup and sizing.
    // Variants implement evaluateSnapshots().
    class Strategy : public IStrategy {
    public:
        explicit Strategy(StrategyConfig config);

        virtual ~Strategy() override = default;

        std::string getName() const override;
        const StrategyConfig& getConfig() const override;

        // Builds a snapshot per universe symbol with bars, then delegates to evaluateSnapshots()
        std::vector<OrderIntent> evaluate(const StrategyInputs& inputs) const override;

        // Latest-bar values plus every configured indicator out of warm-up.
        // Throws core::DataUnavailableException for an empty series.
        MarketDataSnapshot buildSnapshot(const std::string& symbol,
                                         const core::TimeSeries<core::Candle>& bars) const;

        // Decision step on prepared snapshots. Exposed so callers can supply their own snapshots.
        virtual std::vector<OrderIntent> evaluateSnapshots(const std::vector<MarketDataSnapshot>& snapshots,
                                                           const StrategyInputs& inputs) const = 0;

        const Rule& getEntryRule() const;

        // Snapshot keys of the configured indicators
        struct IndicatorNames {
            std::string trend_sma;
            std::string avg_volume;
            std::string adx;
            std::string rsi;
            std::string atr;
            std::string roc_fast;
            std::string roc_slow;
            std::string trend_roc;
        };
        const IndicatorNames& getIndicatorNames() const { return names_; }

    protected:
        // Filters common to every variant, driven by which config fields are set
        std::vector<std::unique_ptr<ICondition>> buildFilterConditions() const;

        void setEntryRule(std::vector<std::unique_ptr<ICondition>> conditions);

        // True when the snapshot passes min_bars and the entry rule. Logs the reason otherwise.
        bool passesEntryRule(const MarketDataSnapshot& snapshot) const;

        // entry_allowed and, when the filter is enabled, an open market gate
        bool entriesEnabled(const StrategyInputs& inputs) const;

        // True (and logged) when the symbol is on the run's exclusion list
        bool entryExcluded(const StrategyInputs& inputs, const std::string& symbol) const;

        // Universe symbols held on this strategy's side -> absolute quantity
        std::map<std::string, long long> heldPositions(const StrategyInputs& inputs) const;

        // floor(budget / K / price), 0 when the price is unusable
        long long sizeFor(double budget, double reference_price) const;

        // LIMIT entry stretched from the latest bar by entry_stretch * ATR:
        // Low - k*ATR for longs, High + k*ATR for shorts, rounded to the
        // tick of that Low/High.
        // nullopt when the price or the size is unusable.
        std::optional<OrderIntent> buildLimitEntry(const MarketDataSnapshot& snapshot, double score,
                                                   double budget) const;

        core::SignalAction entryAction() const;
        core::SignalAction exitAction() const;

        static const MarketDataSnapshot* findSnapshot(const std::vector<MarketDataSnapshot>& snapshots,
                                                      const std::string& symbol);

        StrategyConfig config_;
        IndicatorNames names_;

    private:
        std::vector<std::unique_ptr<indicators::IIndicator>> createIndicators() const;
        void addDerivedValues(MarketDataSnapshot& snapshot,
                              const std::map<std::string, indicators::IndicatorSeries>& series) const;

        std::unique_ptr<Rule> entry_rule_;
        const AndCondition* entry_condition_ = nullptr; // Owned by entry_rule_
    };

} // namespace strategy_engine
