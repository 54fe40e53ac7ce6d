#include "indicator_condition.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <utility>

namespace strategy_engine {

namespace {

    constexpr double kEqualityTolerance = 1e-9;

    struct OperandResolver {
        const MarketDataSnapshot& snapshot;

        std::optional<double> operator()(double value) const { return value; }
        std::optional<double> operator()(const std::string& name) const { return snapshot.get(name); }
    };

    struct OperandText {
        std::string operator()(double value) const { return fmt::format("{}", value); }
        std::string operator()(const std::string& name) const { return name; }
    };

} // end anonymous namespace

IndicatorCondition::IndicatorCondition(std::string lhs, ComparisonOp op, double value)
    : lhs_(std::move(lhs)), op_(op), rhs_(value)
{
    if (lhs_.empty()) {
        throw std::invalid_argument("IndicatorCondition needs a left-hand name.");
    }
}

IndicatorCondition::IndicatorCondition(std::string lhs, ComparisonOp op, std::string rhs_name)
    : lhs_(std::move(lhs)), op_(op), rhs_(std::move(rhs_name))
{
    const std::string& rhs = std::get<std::string>(rhs_);
    if (lhs_.empty() || rhs.empty()) {
        throw std::invalid_argument("IndicatorCondition names cannot be empty.");
    }
    if (lhs_ == rhs) {
        throw std::invalid_argument(fmt::format("IndicatorCondition compares '{}' with itself.", lhs_));
    }
}

bool IndicatorCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    std::optional<double> left = snapshot.get(lhs_);
    std::optional<double> right = std::visit(OperandResolver{snapshot}, rhs_);
    if (!left || !right) {
        core::logging::getLogger()->trace("{} on {}: operand unavailable", describe(), snapshot.symbol);
        return false;
    }

    switch (op_) {
        case ComparisonOp::GT:  return *left > *right;
        case ComparisonOp::LT:  return *left < *right;
        case ComparisonOp::GTE: return *left >= *right;
        case ComparisonOp::LTE: return *left <= *right;
        case ComparisonOp::EQ:  return std::fabs(*left - *right) < kEqualityTolerance;
    }
    throw std::logic_error("Unhandled ComparisonOp in IndicatorCondition");
}

std::string IndicatorCondition::describe() const {
    return fmt::format("{} {} {}", lhs_, toString(op_), std::visit(OperandText{}, rhs_));
}

} // namespace strategy_engine
