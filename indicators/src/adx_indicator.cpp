#include "adx_indicator.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>

namespace indicators {

AdxIndicator::AdxIndicator(int period)
    : TaLibIndicator(fmt::format("ADX({})", period), TA_ADX_Lookback(requirePeriod(period, 2, "ADX"))),
      period_(period) {}

int AdxIndicator::runTaLib(const core::TimeSeries<core::Candle>& input, RawOutput& out) const {
    std::vector<double> highs = extractSource(input, Source::High);
    std::vector<double> lows = extractSource(input, Source::Low);
    std::vector<double> closes = extractSource(input, Source::Close);
    return TA_ADX(0, static_cast<int>(input.size()) - 1,
                  highs.data(), lows.data(), closes.data(), period_,
                  &out.begin_idx, &out.count, out.values.data());
}

} // namespace indicators
