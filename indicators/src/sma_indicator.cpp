#include "sma_indicator.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>

namespace indicators {

SmaIndicator::SmaIndicator(int period, Source source)
    : TaLibIndicator(source == Source::Volume ? fmt::format("SMA(Volume,{})", period)
                                              : fmt::format("SMA({})", period),
                     TA_MA_Lookback(requirePeriod(period, 1, "SMA"), TA_MAType_SMA)),
      period_(period),
      source_(source) {}

int SmaIndicator::runTaLib(const core::TimeSeries<core::Candle>& input, RawOutput& out) const {
    std::vector<double> values = extractSource(input, source_);
    return TA_MA(0, static_cast<int>(values.size()) - 1, values.data(),
                 period_, TA_MAType_SMA,
                 &out.begin_idx, &out.count, out.values.data());
}

} // namespace indicators
