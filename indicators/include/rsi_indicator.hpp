#pragma once

#include "ta_lib_indicator.hpp"

namespace indicators {

// Wilder RSI over closing prices, bounded [0, 100]
class RsiIndicator : public TaLibIndicator {
public:
    explicit RsiIndicator(int period);

protected:
    int runTaLib(const core::TimeSeries<core::Candle>& input, RawOutput& out) const override;
    const char* taFunction() const override { return "TA_RSI"; }

private:
    int period_;
};

} // namespace indicators
