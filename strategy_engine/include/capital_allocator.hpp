#pragma once

#include "datatypes.hpp"
#include <string>
#include <vector>
#include <utility>

namespace strategy_engine {

    struct StrategyBudget {
        std::string strategy;
        double allocated = 0.0;
    };

    // Splits usable capital between strategies.
    // usable = (buying power + gross position value) * (1 - buffer), budget = usable * fraction.
    class CapitalAllocator {
    public:
        // Throws core::CapitalStateException unless 0 <= safety_buffer < 1
        explicit CapitalAllocator(double safety_buffer = 0.20);

        // Throws core::CapitalStateException on negative or non-finite account figures
        double usableCapital(const core::AccountSnapshot& account) const;

        // fractions: (strategy id, allocation). Negative fractions or a sum above 1 throw.
        std::vector<StrategyBudget> allocate(const core::AccountSnapshot& account,
                                             const std::vector<std::pair<std::string, double>>& fractions) const;

        double getSafetyBuffer() const { return safety_buffer_; }

    private:
        double safety_buffer_;
    };

} // namespace strategy_engine
