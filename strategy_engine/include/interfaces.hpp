#pragma once

#include <vector>
#include <string>
#include <memory> // For std::unique_ptr
#include <map>
#include <set>
#include <optional>

#include "datatypes.hpp" // Provides Candle, SignalAction, Position etc.
#include "common_types.hpp"

namespace strategy_engine {

    struct StrategyConfig;

    // Latest-bar view of one symbol, as of the evaluation date.
    // indicator_values always holds Open, High, Low, Close and Volume
    // plus every indicator (e.g. "SMA(100)" -> 123.45) that is out of warm-up.
    struct MarketDataSnapshot {
        std::string symbol;
        core::Timestamp current_time;
        core::Candle current_candle;
        std::size_t bar_count = 0;
        std::map<std::string, double> indicator_values;

        std::optional<double> get(const std::string& name) const {
            auto it = indicator_values.find(name);
            if (it == indicator_values.end()) return std::nullopt;
            return it->second;
        }
    };

    // Everything a strategy needs for one run. Read-only.
    struct StrategyInputs {
        std::vector<std::string> universe;
        std::map<std::string, core::TimeSeries<core::Candle>> bars; // Chronological, by symbol
        double budget = 0.0;
        std::vector<core::Position> positions; // Aggregate account holdings
        std::set<std::string> excluded;        // Never entered; held ones still get exits
        bool market_gate_open = true;
        core::Timestamp now;
    };

    // --- Condition Interface ---
    // Represents a single logical condition (e.g., Close > SMA(100), RSI(2) < 30)
    class ICondition {
    public:
        virtual ~ICondition() = default;
        // Evaluates the condition based on the current market snapshot
        virtual bool evaluate(const MarketDataSnapshot& snapshot) const = 0;
        virtual std::string describe() const = 0;
    };

    // --- Rule Interface ---
    // An entry or exit trigger composed of one or more conditions
    class IRule {
        public:
            virtual ~IRule() = default;
            // Evaluates the rule, returning the action if triggered, None otherwise
            virtual core::SignalAction evaluate(const MarketDataSnapshot& snapshot) const = 0;
            virtual std::string describe() const = 0;
            virtual std::string getName() const = 0;
    };

    // --- Strategy Interface ---
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        // Unique strategy id, e.g. "mr-long"
        virtual std::string getName() const = 0;

        virtual const StrategyConfig& getConfig() const = 0;

        // Produce this run's order intents. Per-symbol failures are logged and skipped.
        virtual std::vector<OrderIntent> evaluate(const StrategyInputs& inputs) const = 0;
    };

} // namespace strategy_engine
