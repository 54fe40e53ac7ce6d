#include "ema_indicator.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>

namespace indicators {

EmaIndicator::EmaIndicator(int period, Source source)
    : TaLibIndicator(source == Source::Volume ? fmt::format("EMA(Volume,{})", period)
                                              : fmt::format("EMA({})", period),
                     TA_EMA_Lookback(requirePeriod(period, 2, "EMA"))),
      period_(period),
      source_(source) {}

int EmaIndicator::runTaLib(const core::TimeSeries<core::Candle>& input, RawOutput& out) const {
    std::vector<double> values = extractSource(input, source_);
    return TA_EMA(0, static_cast<int>(values.size()) - 1, values.data(), period_,
                  &out.begin_idx, &out.count, out.values.data());
}

} // namespace indicators
