#pragma once
#include "datatypes.hpp"     // Use short path (Provides core types)
#include <string>

namespace strategy_engine {

    // Enum for comparison types
    enum class ComparisonOp {
        GT,  // Greater Than (>)
        LT,  // Less Than (<)
        GTE, // Greater Than or Equal To (>=)
        LTE, // Less Than or Equal To (<=)
        EQ   // Equal To (==)
    };

    // Strategy variants. Each maps to one concrete IStrategy implementation.
    enum class StrategyKind {
        Momentum,
        Growth,
        Defensive,
        Bitcoin,
        MeanReversionLong,
        MeanReversionShort,
        HftLong,
        HftShort
    };

    enum class OrderType {
        Market,
        Limit
    };

    enum class TimeInForce {
        Day,
        Gtc,
        Gtd
    };

    // What a strategy wants traded. Turned into an orders::OrderRecord by the OrderBuilder.
    struct OrderIntent {
        std::string symbol;
        core::SignalAction action = core::SignalAction::None;
        OrderType order_type = OrderType::Market;
        double reference_price = 0.0; // Price used for sizing (close, or the limit for LIMIT orders)
        double limit_price = 0.0;     // Only meaningful for OrderType::Limit
        long long quantity = 0;
        TimeInForce time_in_force = TimeInForce::Day;
        std::string good_till_date;   // "YYYY-MM-DDTHH:MM:SS", GTD only
        bool attach_moc = false;
        double score = 0.0;
    };

    std::string toString(ComparisonOp op);
    std::string toString(StrategyKind kind);
    std::string toString(OrderType type);
    std::string toString(TimeInForce tif);

    // Throws std::invalid_argument on unknown names
    StrategyKind stringToStrategyKind(const std::string& kind_str);

} // namespace strategy_engine
