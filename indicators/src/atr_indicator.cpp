#include "atr_indicator.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>

namespace indicators {

AtrIndicator::AtrIndicator(int period)
    : TaLibIndicator(fmt::format("ATR({})", period), TA_ATR_Lookback(requirePeriod(period, 1, "ATR"))),
      period_(period) {}

int AtrIndicator::runTaLib(const core::TimeSeries<core::Candle>& input, RawOutput& out) const {
    std::vector<double> highs = extractSource(input, Source::High);
    std::vector<double> lows = extractSource(input, Source::Low);
    std::vector<double> closes = extractSource(input, Source::Close);
    return TA_ATR(0, static_cast<int>(input.size()) - 1,
                  highs.data(), lows.data(), closes.data(), period_,
                  &out.begin_idx, &out.count, out.values.data());
}

} // namespace indicators
