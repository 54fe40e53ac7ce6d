#include "rule.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>
#include <utility>

namespace strategy_engine {

Rule::Rule(std::string name, std::unique_ptr<ICondition> condition, core::SignalAction action)
    : name_(std::move(name)), condition_(std::move(condition)), action_(action)
{
    if (name_.empty()) {
        throw std::invalid_argument("Rule needs a name.");
    }
    if (!condition_) {
        throw std::invalid_argument(fmt::format("Rule '{}' has no condition.", name_));
    }
    if (action_ == core::SignalAction::None) {
        throw std::invalid_argument(fmt::format("Rule '{}' must trigger an action.", name_));
    }
}

core::SignalAction Rule::evaluate(const MarketDataSnapshot& snapshot) const {
    const bool triggered = condition_->evaluate(snapshot);
    core::logging::getLogger()->trace("[{}] {} {}", name_, snapshot.symbol, triggered ? "triggered" : "not triggered");
    return triggered ? action_ : core::SignalAction::None;
}

std::string Rule::describe() const {
    return fmt::format("{}: {} => {}", name_, condition_->describe(), core::toString(action_));
}

} // namespace strategy_engine
