#pragma once

#include "interfaces.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strategy_engine {

    using ConditionList = std::vector<std::unique_ptr<ICondition>>;

    // Conjunction of entry filters, checked in order. Empty lists and
    // null members are rejected with std::invalid_argument.
    class AndCondition : public ICondition {
    public:
        explicit AndCondition(ConditionList conditions);

        bool evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;

        // describe() of the first filter the snapshot fails; nullopt if it passes all
        std::optional<std::string> firstFailure(const MarketDataSnapshot& snapshot) const;

        std::size_t size() const { return conditions_.size(); }

    private:
        ConditionList conditions_;
    };

} // namespace strategy_engine
