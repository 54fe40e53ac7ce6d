#include "ta_lib_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <stdexcept>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace indicators {

TaLibIndicator::TaLibIndicator(std::string name, int lookback)
    : name_(std::move(name)), lookback_(lookback) {
    if (lookback_ < 0) {
        throw std::runtime_error(fmt::format("TA-Lib lookback for {} returned an unexpected value: {}", name_, lookback_));
    }
    core::logging::getLogger()->trace("Indicator created: Name='{}', Lookback={}", name_, lookback_);
}

int TaLibIndicator::requirePeriod(int period, int minimum, const char* label) {
    if (period < minimum) {
        throw std::invalid_argument(fmt::format("{} period must be at least {} (got {}).", label, minimum, period));
    }
    return period;
}

void TaLibIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    results_.assign(input.size(), std::nullopt);

    // Not enough data: every slot stays unavailable
    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) too small for {} (lookback {}).", input.size(), name_, lookback_);
        return;
    }

    RawOutput out;
    out.values.resize(input.size() - static_cast<size_t>(lookback_));

    int ret_code = runTaLib(input, out);
    if (ret_code != TA_SUCCESS) {
        logger->error("TA-Lib {} calculation failed for {} with error code: {}", taFunction(), name_, ret_code);
        throw core::IndicatorCalculationException(
            fmt::format("{} failed for {} with code {}", taFunction(), name_, ret_code));
    }

    if (out.begin_idx != lookback_) {
        logger->warn("{} out_begin_idx ({}) does not match calculated lookback ({}) for {}.",
                     taFunction(), out.begin_idx, lookback_, name_);
    }

    results_ = alignOutput(input.size(), out.begin_idx, out.count, out.values);
    logger->trace("Calculated {} values for {}", out.count, name_);
}

} // namespace indicators
