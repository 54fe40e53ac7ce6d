#pragma once

#include "datatypes.hpp"
#include "common_types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace strategy_engine {

    using json = nlohmann::json;

    // Parameters of one strategy instance. Built once from defaults for its kind
    // plus JSON overrides, validated, then never modified.
    struct StrategyConfig {
        std::string id;
        StrategyKind kind = StrategyKind::Momentum;
        core::Side side = core::Side::Long;

        // Universe: a named list resolved by the market data provider,
        // or an explicit symbol list when universe_name is empty.
        std::string universe_name;
        std::vector<std::string> universe_symbols;

        double allocation = 0.0;   // Fraction of usable capital
        int max_positions = 1;     // K
        bool entry_allowed = true;
        bool use_market_filter = false;

        std::string security_type = "STK";
        std::string exchange = "SMART";

        int min_bars = 0;          // Symbols with fewer bars are not entered
        int history_bars = 0;      // Bars fetched per symbol
        bool monthly_rebalance = false; // Evaluate bars ending on the last-Friday data end date

        // Rotation score = weight_fast * ROC(fast) + weight_slow * ROC(slow)
        int roc_period_fast = 0;
        int roc_period_slow = 0;
        double roc_weight_fast = 1.0;
        double roc_weight_slow = 1.0;
        int worst_rank = 0;        // Held symbols ranked within this many are kept
        int since_true = 0;        // Score must have been > 0 on each of the last N bars

        // Trend-hold: ROC(trend_roc_period) > 0 on each of the last trend_bars bars
        int trend_roc_period = 0;
        int trend_bars = 0;

        int trend_sma_period = 0;  // Close > SMA(n); 0 disables

        double min_price = 0.0;    // Lower Close bound (0 disables)
        double max_price = 0.0;    // Upper Close bound (0 disables)
        bool price_band_inclusive = false; // Close == bound passes when true

        int volume_period = 0;
        bool volume_uses_ema = false;
        double min_avg_volume = 0.0;

        int adx_period = 0;
        double adx_threshold = 0.0;

        int rsi_period = 0;
        double rsi_threshold = 0.0;  // RSI < t for longs, RSI > t for shorts

        std::optional<double> ibr_threshold; // IBR < t for longs, IBR > t for shorts

        int atr_period = 0;
        double entry_stretch = 0.0;  // Limit = Low - stretch*ATR (long) / High + stretch*ATR (short)

        TimeInForce entry_time_in_force = TimeInForce::Day;
        bool attach_moc = false;
        int gtd_hour = 15;
        int gtd_minute = 44;
    };

    // Breadth series gating momentum entries
    struct MarketGateConfig {
        std::string symbol = "#NYSEHL";
        int ma_period = 13;
        int history_bars = 40;
    };

    struct EngineConfig {
        double safety_buffer = 0.20;
        std::string output_dir = "signals";
        std::string database_path = "data/market_data.db";
        std::string brokerage_url = "http://localhost:3000";
        std::string freshness_symbol = "SPY";
        std::vector<std::string> excluded_symbols{"GOOG"};
        MarketGateConfig market_gate;
        std::vector<StrategyConfig> strategies;
    };

    // Reference parameters for a strategy kind
    StrategyConfig defaultStrategyConfig(StrategyKind kind);

    // All eight strategies with reference parameters
    EngineConfig defaultEngineConfig();

    // One "strategies" entry: "kind" selects the defaults, other keys override them.
    // Throws core::ConfigException.
    StrategyConfig parseStrategyConfig(const json& config);

    // Parse and validate. Throws core::ConfigException on any malformed field.
    EngineConfig parseEngineConfig(const json& config);
    EngineConfig loadEngineConfig(const std::string& path);

    // Throws core::ConfigException
    void validateEngineConfig(const EngineConfig& config);

} // namespace strategy_engine
