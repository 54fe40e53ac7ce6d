#include "engine_config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <set>
#include <cmath>

namespace strategy_engine {

    namespace { // File-local helpers

        template <typename T>
        void readOptional(const json& obj, const char* key, T& target) {
            if (!obj.contains(key)) return;
            try {
                target = obj.at(key).get<T>();
            } catch (const json::exception& e) {
                throw core::ConfigException(fmt::format("Invalid value for '{}': {}", key, e.what()));
            }
        }

        bool isRotation(StrategyKind kind) {
            return kind == StrategyKind::Momentum || kind == StrategyKind::Growth ||
                   kind == StrategyKind::Defensive;
        }

        bool isShortKind(StrategyKind kind) {
            return kind == StrategyKind::MeanReversionShort || kind == StrategyKind::HftShort;
        }

        TimeInForce stringToTimeInForce(const std::string& tif_str) {
            if (tif_str == "DAY") return TimeInForce::Day;
            if (tif_str == "GTC") return TimeInForce::Gtc;
            if (tif_str == "GTD") return TimeInForce::Gtd;
            throw core::ConfigException("Unknown time in force: " + tif_str);
        }

        StrategyConfig meanReversionDefaults(StrategyKind kind) {
            StrategyConfig c;
            c.kind = kind;
            c.universe_name = "S&P 500";
            c.allocation = 0.15;
            c.max_positions = 10;
            c.min_bars = 200;
            c.history_bars = 201;
            c.trend_sma_period = 100;
            c.min_price = 5.0;
            c.volume_period = 50;
            c.min_avg_volume = 200000.0;
            c.adx_period = 10;
            c.adx_threshold = 30.0;
            c.atr_period = 10;
            c.entry_time_in_force = TimeInForce::Gtc;
            return c;
        }

        StrategyConfig hftDefaults(StrategyKind kind) {
            StrategyConfig c;
            c.kind = kind;
            c.universe_name = "Russell 1000";
            c.allocation = 0.25;
            c.max_positions = 15;
            c.min_bars = 251;
            c.history_bars = 252;
            c.trend_sma_period = 250;
            c.max_price = 5000.0;
            c.price_band_inclusive = true;
            c.volume_period = 50;
            c.volume_uses_ema = true;
            c.min_avg_volume = 2000000.0;
            c.adx_period = 4;
            c.adx_threshold = 35.0;
            c.atr_period = 5;
            c.security_type = "CFD";
            c.entry_time_in_force = TimeInForce::Gtd;
            c.attach_moc = true;
            return c;
        }

        StrategyConfig rotationDefaults(StrategyKind kind) {
            StrategyConfig c;
            c.kind = kind;
            c.min_bars = 250;
            c.history_bars = 251;
            c.monthly_rebalance = true;
            c.roc_period_fast = 75;
            c.roc_period_slow = 150;
            c.since_true = 5;
            c.max_positions = 1;
            return c;
        }

        StrategyConfig parseStrategyFields(const json& obj) {
            if (!obj.is_object()) {
                throw core::ConfigException("Strategy entry must be a JSON object.");
            }
            if (!obj.contains("kind") || !obj["kind"].is_string()) {
                throw core::ConfigException("Strategy entry missing 'kind' (string).");
            }

            StrategyKind kind;
            try {
                kind = stringToStrategyKind(obj["kind"].get<std::string>());
            } catch (const std::invalid_argument& e) {
                throw core::ConfigException(e.what());
            }

            StrategyConfig c = defaultStrategyConfig(kind);
            readOptional(obj, "id", c.id);
            readOptional(obj, "universe", c.universe_name);
            if (obj.contains("symbols")) {
                readOptional(obj, "symbols", c.universe_symbols);
                if (!obj.contains("universe")) c.universe_name.clear();
            }
            readOptional(obj, "allocation", c.allocation);
            readOptional(obj, "max_positions", c.max_positions);
            readOptional(obj, "entry_allowed", c.entry_allowed);
            readOptional(obj, "use_market_filter", c.use_market_filter);
            readOptional(obj, "security_type", c.security_type);
            readOptional(obj, "exchange", c.exchange);
            readOptional(obj, "min_bars", c.min_bars);
            readOptional(obj, "history_bars", c.history_bars);
            readOptional(obj, "monthly_rebalance", c.monthly_rebalance);
            readOptional(obj, "roc_period_fast", c.roc_period_fast);
            readOptional(obj, "roc_period_slow", c.roc_period_slow);
            readOptional(obj, "roc_weight_fast", c.roc_weight_fast);
            readOptional(obj, "roc_weight_slow", c.roc_weight_slow);
            readOptional(obj, "worst_rank", c.worst_rank);
            readOptional(obj, "since_true", c.since_true);
            readOptional(obj, "trend_roc_period", c.trend_roc_period);
            readOptional(obj, "trend_bars", c.trend_bars);
            readOptional(obj, "trend_sma_period", c.trend_sma_period);
            readOptional(obj, "min_price", c.min_price);
            readOptional(obj, "max_price", c.max_price);
            readOptional(obj, "price_band_inclusive", c.price_band_inclusive);
            readOptional(obj, "volume_period", c.volume_period);
            readOptional(obj, "volume_uses_ema", c.volume_uses_ema);
            readOptional(obj, "min_avg_volume", c.min_avg_volume);
            readOptional(obj, "adx_period", c.adx_period);
            readOptional(obj, "adx_threshold", c.adx_threshold);
            readOptional(obj, "rsi_period", c.rsi_period);
            readOptional(obj, "rsi_threshold", c.rsi_threshold);
            if (obj.contains("ibr_threshold")) {
                double ibr = 0.0;
                readOptional(obj, "ibr_threshold", ibr);
                c.ibr_threshold = ibr;
            }
            readOptional(obj, "atr_period", c.atr_period);
            readOptional(obj, "entry_stretch", c.entry_stretch);
            if (obj.contains("time_in_force")) {
                std::string tif;
                readOptional(obj, "time_in_force", tif);
                c.entry_time_in_force = stringToTimeInForce(tif);
            }
            readOptional(obj, "attach_moc", c.attach_moc);
            readOptional(obj, "gtd_hour", c.gtd_hour);
            readOptional(obj, "gtd_minute", c.gtd_minute);
            return c;
        }

        void validateStrategy(const StrategyConfig& c) {
            auto fail = [&c](const std::string& what) {
                throw core::ConfigException(fmt::format("Strategy '{}': {}", c.id, what));
            };

            if (c.id.empty()) throw core::ConfigException("Strategy id cannot be empty.");
            if (c.universe_name.empty() && c.universe_symbols.empty()) fail("universe is empty");
            if (!std::isfinite(c.allocation) || c.allocation < 0.0) fail("allocation must be >= 0");
            if (c.max_positions < 1) fail("max_positions must be >= 1");
            if (c.min_bars < 0) fail("min_bars must be >= 0");
            if (c.history_bars < c.min_bars || c.history_bars < 2) fail("history_bars must cover min_bars");
            if ((c.side == core::Side::Short) != isShortKind(c.kind)) fail("side does not match strategy kind");
            if (c.gtd_hour < 0 || c.gtd_hour > 23 || c.gtd_minute < 0 || c.gtd_minute > 59) fail("invalid GTD time");
            if (c.max_price > 0.0 && c.max_price <= c.min_price) fail("max_price must exceed min_price");

            switch (c.kind) {
                case StrategyKind::Momentum:
                case StrategyKind::Growth:
                case StrategyKind::Defensive:
                    if (c.roc_period_fast <= 0 || c.roc_period_slow <= 0) fail("ROC periods must be positive");
                    if (c.worst_rank < c.max_positions) fail("worst_rank must be >= max_positions");
                    if (c.since_true <= 0 && c.trend_sma_period <= 0) fail("rotation needs since_true or trend_sma_period");
                    break;
                case StrategyKind::Bitcoin:
                    if (c.trend_roc_period <= 0 || c.trend_bars <= 0) fail("trend_roc_period and trend_bars must be positive");
                    break;
                case StrategyKind::MeanReversionLong:
                case StrategyKind::MeanReversionShort:
                case StrategyKind::HftLong:
                case StrategyKind::HftShort:
                    if (c.trend_sma_period < 2 || c.adx_period < 2 || c.atr_period <= 0 || c.volume_period < 2) {
                        fail("indicator periods must be positive");
                    }
                    if (c.entry_stretch < 0.0) fail("entry_stretch must be >= 0");
                    if ((c.kind == StrategyKind::MeanReversionLong || c.kind == StrategyKind::MeanReversionShort) && c.rsi_period < 2) {
                        fail("rsi_period must be >= 2");
                    }
                    if ((c.kind == StrategyKind::HftLong || c.kind == StrategyKind::HftShort) && !c.ibr_threshold) {
                        fail("ibr_threshold is required");
                    }
                    break;
            }
        }

    } // end anonymous namespace

    StrategyConfig parseStrategyConfig(const json& config) {
        StrategyConfig strategy = parseStrategyFields(config);
        validateStrategy(strategy);
        return strategy;
    }

    StrategyConfig defaultStrategyConfig(StrategyKind kind) {
        StrategyConfig c;
        switch (kind) {
            case StrategyKind::Momentum:
                c = rotationDefaults(kind);
                c.id = "momo";
                c.universe_name = "NASDAQ 100";
                c.allocation = 0.05;
                c.max_positions = 3;
                c.worst_rank = 5;
                c.roc_period_fast = 120;
                c.roc_period_slow = 240;
                c.roc_weight_fast = 0.5;
                c.roc_weight_slow = 0.5;
                c.since_true = 0;
                c.trend_sma_period = 100;
                c.use_market_filter = true;
                break;
            case StrategyKind::Growth:
                c = rotationDefaults(kind);
                c.id = "growth";
                c.universe_symbols = {"QQQ", "SPY", "IOO"};
                c.allocation = 0.10;
                c.worst_rank = 2;
                break;
            case StrategyKind::Defensive:
                c = rotationDefaults(kind);
                c.id = "def";
                c.universe_symbols = {"GLD", "TLT"};
                c.allocation = 0.03;
                c.worst_rank = 1;
                break;
            case StrategyKind::Bitcoin:
                c.kind = kind;
                c.id = "btc";
                c.universe_symbols = {"IBIT"};
                c.allocation = 0.02;
                c.max_positions = 1;
                c.min_bars = 50;
                c.history_bars = 50;
                c.trend_roc_period = 40;
                c.trend_bars = 4;
                break;
            case StrategyKind::MeanReversionLong:
                c = meanReversionDefaults(kind);
                c.id = "mr-long";
                c.rsi_period = 2;
                c.rsi_threshold = 30.0;
                c.entry_stretch = 0.5;
                break;
            case StrategyKind::MeanReversionShort:
                c = meanReversionDefaults(kind);
                c.id = "mr-short";
                c.side = core::Side::Short;
                c.rsi_period = 3;
                c.rsi_threshold = 90.0;
                c.entry_stretch = 0.8;
                break;
            case StrategyKind::HftLong:
                c = hftDefaults(kind);
                c.id = "hft-long";
                c.min_price = 10.0;
                c.ibr_threshold = 0.3;
                c.entry_stretch = 0.6;
                break;
            case StrategyKind::HftShort:
                c = hftDefaults(kind);
                c.id = "hft-short";
                c.side = core::Side::Short;
                c.min_price = 20.0;
                c.ibr_threshold = 0.7;
                c.entry_stretch = 0.3;
                break;
        }
        return c;
    }

    EngineConfig defaultEngineConfig() {
        EngineConfig config;
        for (StrategyKind kind : {StrategyKind::Momentum, StrategyKind::Growth, StrategyKind::Defensive,
                                  StrategyKind::Bitcoin, StrategyKind::MeanReversionLong,
                                  StrategyKind::MeanReversionShort, StrategyKind::HftLong,
                                  StrategyKind::HftShort}) {
            config.strategies.push_back(defaultStrategyConfig(kind));
        }
        return config;
    }

    void validateEngineConfig(const EngineConfig& config) {
        if (!std::isfinite(config.safety_buffer) || config.safety_buffer < 0.0 || config.safety_buffer >= 1.0) {
            throw core::ConfigException(fmt::format("safety_buffer must be in [0, 1), got {}", config.safety_buffer));
        }
        if (config.market_gate.symbol.empty() || config.market_gate.ma_period < 2 ||
            config.market_gate.history_bars <= config.market_gate.ma_period) {
            throw core::ConfigException("market_gate needs a symbol, ma_period >= 2 and history_bars > ma_period.");
        }
        if (config.strategies.empty()) {
            throw core::ConfigException("No strategies configured.");
        }

        std::set<std::string> ids;
        double total_allocation = 0.0;
        for (const auto& strategy : config.strategies) {
            validateStrategy(strategy);
            if (!ids.insert(strategy.id).second) {
                throw core::ConfigException("Duplicate strategy id: " + strategy.id);
            }
            total_allocation += strategy.allocation;
        }
        if (total_allocation > 1.0 + 1e-9) {
            throw core::ConfigException(fmt::format("Strategy allocations sum to {:.4f}, more than 1.", total_allocation));
        }
    }

    EngineConfig parseEngineConfig(const json& config) {
        if (!config.is_object()) {
            throw core::ConfigException("Engine config must be a JSON object.");
        }

        EngineConfig engine;
        readOptional(config, "safety_buffer", engine.safety_buffer);
        readOptional(config, "output_dir", engine.output_dir);
        readOptional(config, "database_path", engine.database_path);
        readOptional(config, "brokerage_url", engine.brokerage_url);
        readOptional(config, "freshness_symbol", engine.freshness_symbol);
        readOptional(config, "excluded_symbols", engine.excluded_symbols);

        if (config.contains("market_gate")) {
            const json& gate = config["market_gate"];
            if (!gate.is_object()) throw core::ConfigException("'market_gate' must be an object.");
            readOptional(gate, "symbol", engine.market_gate.symbol);
            readOptional(gate, "ma_period", engine.market_gate.ma_period);
            readOptional(gate, "history_bars", engine.market_gate.history_bars);
        }

        if (config.contains("strategies")) {
            if (!config["strategies"].is_array()) throw core::ConfigException("'strategies' must be an array.");
            for (const auto& entry : config["strategies"]) {
                engine.strategies.push_back(parseStrategyFields(entry));
            }
        } else {
            engine.strategies = defaultEngineConfig().strategies;
        }

        validateEngineConfig(engine);
        return engine;
    }

    EngineConfig loadEngineConfig(const std::string& path) {
        auto logger = core::logging::getLogger();
        std::ifstream config_file(path);
        if (!config_file.is_open()) {
            throw core::ConfigException("Could not open config file: " + path);
        }

        json config;
        try {
            config_file >> config;
        } catch (const json::parse_error& e) {
            throw core::ConfigException(fmt::format("Failed to parse JSON in {}: {}", path, e.what()));
        }

        EngineConfig engine = parseEngineConfig(config);
        logger->info("Loaded {} strategies from {} (buffer {:.0f}%)",
                     engine.strategies.size(), path, engine.safety_buffer * 100.0);
        return engine;
    }

} // namespace strategy_engine
