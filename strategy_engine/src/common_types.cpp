#include "common_types.hpp"
#include <stdexcept>

namespace strategy_engine {

    std::string toString(ComparisonOp op) {
        switch (op) {
            case ComparisonOp::GT:  return ">";
            case ComparisonOp::LT:  return "<";
            case ComparisonOp::GTE: return ">=";
            case ComparisonOp::LTE: return "<=";
            case ComparisonOp::EQ:  return "==";
        }
        return "InvalidOp";
    }

    std::string toString(StrategyKind kind) {
        switch (kind) {
            case StrategyKind::Momentum:           return "Momentum";
            case StrategyKind::Growth:             return "Growth";
            case StrategyKind::Defensive:          return "Defensive";
            case StrategyKind::Bitcoin:            return "Bitcoin";
            case StrategyKind::MeanReversionLong:  return "MeanReversionLong";
            case StrategyKind::MeanReversionShort: return "MeanReversionShort";
            case StrategyKind::HftLong:            return "HftLong";
            case StrategyKind::HftShort:           return "HftShort";
        }
        return "UnknownKind";
    }

    std::string toString(OrderType type) {
        return type == OrderType::Limit ? "LIMIT" : "MARKET";
    }

    std::string toString(TimeInForce tif) {
        switch (tif) {
            case TimeInForce::Day: return "DAY";
            case TimeInForce::Gtc: return "GTC";
            case TimeInForce::Gtd: return "GTD";
        }
        return "DAY";
    }

    StrategyKind stringToStrategyKind(const std::string& kind_str) {
        if (kind_str == "Momentum") return StrategyKind::Momentum;
        if (kind_str == "Growth") return StrategyKind::Growth;
        if (kind_str == "Defensive") return StrategyKind::Defensive;
        if (kind_str == "Bitcoin") return StrategyKind::Bitcoin;
        if (kind_str == "MeanReversionLong") return StrategyKind::MeanReversionLong;
        if (kind_str == "MeanReversionShort") return StrategyKind::MeanReversionShort;
        if (kind_str == "HftLong") return StrategyKind::HftLong;
        if (kind_str == "HftShort") return StrategyKind::HftShort;
        throw std::invalid_argument("Unknown strategy kind string: " + kind_str);
    }

} // namespace strategy_engine
