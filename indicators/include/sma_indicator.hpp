#pragma once

#include "ta_lib_indicator.hpp"

namespace indicators {

// Simple moving average of closes or volumes, e.g. "SMA(100)", "SMA(Volume,50)"
class SmaIndicator : public TaLibIndicator {
public:
    explicit SmaIndicator(int period, Source source = Source::Close);

protected:
    int runTaLib(const core::TimeSeries<core::Candle>& input, RawOutput& out) const override;
    const char* taFunction() const override { return "TA_MA"; }

private:
    int period_;
    Source source_;
};

} // namespace indicators
