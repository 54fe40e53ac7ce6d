#include "capital_allocator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace strategy_engine {

CapitalAllocator::CapitalAllocator(double safety_buffer) : safety_buffer_(safety_buffer) {
    if (!std::isfinite(safety_buffer_) || safety_buffer_ < 0.0 || safety_buffer_ >= 1.0) {
        throw core::CapitalStateException(
            fmt::format("Safety buffer must be in [0, 1), got {}", safety_buffer_));
    }
}

double CapitalAllocator::usableCapital(const core::AccountSnapshot& account) const {
    if (!std::isfinite(account.buying_power) || account.buying_power < 0.0) {
        throw core::CapitalStateException(
            fmt::format("Invalid buying power: {}", account.buying_power));
    }
    if (!std::isfinite(account.gross_position_value) || account.gross_position_value < 0.0) {
        throw core::CapitalStateException(
            fmt::format("Invalid gross position value: {}", account.gross_position_value));
    }
    return (account.buying_power + account.gross_position_value) * (1.0 - safety_buffer_);
}

std::vector<StrategyBudget> CapitalAllocator::allocate(
    const core::AccountSnapshot& account,
    const std::vector<std::pair<std::string, double>>& fractions) const
{
    auto logger = core::logging::getLogger();

    double total_fraction = 0.0;
    for (const auto& [strategy, fraction] : fractions) {
        if (!std::isfinite(fraction) || fraction < 0.0) {
            throw core::CapitalStateException(
                fmt::format("Invalid allocation {} for strategy '{}'", fraction, strategy));
        }
        total_fraction += fraction;
    }
    if (total_fraction > 1.0 + 1e-9) {
        throw core::CapitalStateException(
            fmt::format("Allocations sum to {:.4f}, exceeding usable capital", total_fraction));
    }

    double usable = usableCapital(account);
    logger->info("Total capital: ${:.2f}, usable after {:.0f}% buffer: ${:.2f}",
                 account.buying_power + account.gross_position_value, safety_buffer_ * 100.0, usable);

    std::vector<StrategyBudget> budgets;
    budgets.reserve(fractions.size());
    for (const auto& [strategy, fraction] : fractions) {
        budgets.push_back(StrategyBudget{strategy, usable * fraction});
        logger->debug("Budget for '{}': {:.1f}% -> ${:.2f}", strategy, fraction * 100.0, budgets.back().allocated);
    }
    return budgets;
}

} // namespace strategy_engine
