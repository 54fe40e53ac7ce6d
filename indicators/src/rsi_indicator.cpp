#include "rsi_indicator.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>

namespace indicators {

RsiIndicator::RsiIndicator(int period)
    : TaLibIndicator(fmt::format("RSI({})", period), TA_RSI_Lookback(requirePeriod(period, 2, "RSI"))),
      period_(period) {}

int RsiIndicator::runTaLib(const core::TimeSeries<core::Candle>& input, RawOutput& out) const {
    std::vector<double> closes = extractSource(input, Source::Close);
    return TA_RSI(0, static_cast<int>(closes.size()) - 1, closes.data(), period_,
                  &out.begin_idx, &out.count, out.values.data());
}

} // namespace indicators
