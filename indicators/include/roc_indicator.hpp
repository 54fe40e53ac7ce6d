#pragma once

#include "ta_lib_indicator.hpp"

namespace indicators {

// Rate of change as a fraction: close[t] / close[t - period] - 1
class RocIndicator : public TaLibIndicator {
public:
    explicit RocIndicator(int period);

protected:
    int runTaLib(const core::TimeSeries<core::Candle>& input, RawOutput& out) const override;
    const char* taFunction() const override { return "TA_ROCR"; }

private:
    int period_;
};

} // namespace indicators
