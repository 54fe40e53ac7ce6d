#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <string>
#include <variant>

namespace strategy_engine {

    // One comparison against a snapshot: "<name> <op> <number>" or
    // "<name> <op> <other name>". Holds false when either side is missing
    // from the snapshot (indicator still warming up, no data).
    //
    //   IndicatorCondition("RSI(2)", ComparisonOp::LT, 30.0)
    //   IndicatorCondition("Close", ComparisonOp::GT, "SMA(100)")
    class IndicatorCondition : public ICondition {
    public:
        using Operand = std::variant<double, std::string>;

        IndicatorCondition(std::string lhs, ComparisonOp op, double value);
        IndicatorCondition(std::string lhs, ComparisonOp op, std::string rhs_name);

        bool evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;

    private:
        std::string lhs_;
        ComparisonOp op_;
        Operand rhs_;
    };

} // namespace strategy_engine
