#pragma once

#include "ta_lib_indicator.hpp"

namespace indicators {

// Exponential moving average, seeded with the SMA of the first `period` values
class EmaIndicator : public TaLibIndicator {
public:
    explicit EmaIndicator(int period, Source source = Source::Close);

protected:
    int runTaLib(const core::TimeSeries<core::Candle>& input, RawOutput& out) const override;
    const char* taFunction() const override { return "TA_EMA"; }

private:
    int period_;
    Source source_;
};

} // namespace indicators
