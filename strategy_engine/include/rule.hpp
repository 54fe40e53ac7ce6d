#pragma once

#include "interfaces.hpp"
#include <memory>
#include <string>

namespace strategy_engine {

    // Named entry trigger, e.g. "mr-long entry": yields `action` when the
    // condition holds for a snapshot, SignalAction::None otherwise.
    class Rule : public IRule {
    public:
        Rule(std::string name, std::unique_ptr<ICondition> condition, core::SignalAction action);

        core::SignalAction evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;
        std::string getName() const override { return name_; }

        const ICondition& getCondition() const { return *condition_; }
        core::SignalAction getAction() const { return action_; }

    private:
        std::string name_;
        std::unique_ptr<ICondition> condition_;
        core::SignalAction action_;
    };

} // namespace strategy_engine
