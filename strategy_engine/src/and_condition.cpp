#include "and_condition.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h> // For fmt::join
#include <stdexcept>

namespace strategy_engine {

AndCondition::AndCondition(ConditionList conditions)
    : conditions_(std::move(conditions))
{
    if (conditions_.empty()) {
         throw std::invalid_argument("AndCondition must receive at least one condition.");
    }
    for (const auto& condition : conditions_) {
        if (!condition) {
            throw std::invalid_argument("AndCondition received a null condition.");
        }
    }
}

bool AndCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    return !firstFailure(snapshot).has_value();
}

std::optional<std::string> AndCondition::firstFailure(const MarketDataSnapshot& snapshot) const {
    for (const auto& condition : conditions_) {
        if (!condition->evaluate(snapshot)) {
            return condition->describe();
        }
    }
    return std::nullopt;
}

std::string AndCondition::describe() const {
    std::vector<std::string> parts;
    parts.reserve(conditions_.size());
    for (const auto& condition : conditions_) {
        parts.push_back(condition->describe());
    }
    return fmt::format("({})", fmt::join(parts, " AND "));
}

} // namespace strategy_engine
