#include "roc_indicator.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>

namespace indicators {

RocIndicator::RocIndicator(int period)
    : TaLibIndicator(fmt::format("ROC({})", period), TA_ROCR_Lookback(requirePeriod(period, 1, "ROC"))),
      period_(period) {}

int RocIndicator::runTaLib(const core::TimeSeries<core::Candle>& input, RawOutput& out) const {
    std::vector<double> closes = extractSource(input, Source::Close);
    // TA_ROCR yields price / prevPrice
    TA_RetCode ret_code = TA_ROCR(0, static_cast<int>(closes.size()) - 1, closes.data(), period_,
                                  &out.begin_idx, &out.count, out.values.data());
    if (ret_code == TA_SUCCESS) {
        for (int i = 0; i < out.count; ++i) {
            out.values[static_cast<size_t>(i)] -= 1.0;
        }
    }
    return ret_code;
}

} // namespace indicators
