#pragma once

#include "indicators.hpp"
#include <string>
#include <vector>

namespace indicators {

// Base for indicators backed by a single-output TA-Lib function.
// Handles the short-history case, return-code checking and alignment;
// subclasses only call their TA-Lib routine.
class TaLibIndicator : public IIndicator {
public:
    std::string getName() const override { return name_; }
    int getLookback() const override { return lookback_; }
    const IndicatorSeries& getResult() const override { return results_; }

    void calculate(const core::TimeSeries<core::Candle>& input) override;

protected:
    // Throws std::runtime_error when the TA-Lib lookback is negative
    TaLibIndicator(std::string name, int lookback);

    // Compact TA-Lib output. `values` is pre-sized to input.size() - lookback.
    struct RawOutput {
        std::vector<double> values;
        int begin_idx = 0;
        int count = 0;
    };

    // Runs the routine over the whole input; returns the TA_RetCode
    virtual int runTaLib(const core::TimeSeries<core::Candle>& input, RawOutput& out) const = 0;
    virtual const char* taFunction() const = 0;

    // Throws std::invalid_argument when period < minimum
    static int requirePeriod(int period, int minimum, const char* label);

private:
    std::string name_;
    int lookback_;
    IndicatorSeries results_;
};

} // namespace indicators
