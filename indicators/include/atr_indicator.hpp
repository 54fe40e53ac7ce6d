#pragma once

#include "ta_lib_indicator.hpp"

namespace indicators {

// Wilder average true range.
// True range = max(high - low, |high - prevClose|, |low - prevClose|).
class AtrIndicator : public TaLibIndicator {
public:
    explicit AtrIndicator(int period);

protected:
    int runTaLib(const core::TimeSeries<core::Candle>& input, RawOutput& out) const override;
    const char* taFunction() const override { return "TA_ATR"; }

private:
    int period_;
};

} // namespace indicators
