#pragma once

#include "ta_lib_indicator.hpp"

namespace indicators {

// Average Directional Index, bounded [0, 100]. Needs 2 * period - 1 bars of warm-up.
class AdxIndicator : public TaLibIndicator {
public:
    explicit AdxIndicator(int period);

protected:
    int runTaLib(const core::TimeSeries<core::Candle>& input, RawOutput& out) const override;
    const char* taFunction() const override { return "TA_ADX"; }

private:
    int period_;
};

} // namespace indicators
