#pragma once

#include "datatypes.hpp" // Needs Candle, TimeSeries
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace indicators {

// Indicator output aligned to the input series. The first getLookback()
// entries (or all of them, when history is too short) are std::nullopt.
using IndicatorSeries = core::TimeSeries<std::optional<double>>;

// Which candle field an indicator reads
enum class Source {
    Close,
    High,
    Low,
    Volume
};

class IIndicator {
public:
    virtual ~IIndicator() = default; // Virtual destructor is important for interfaces!

    // Get the name of the indicator (e.g., "SMA(100)", "SMA(Volume,50)")
    virtual std::string getName() const = 0;

    // Number of leading input bars consumed before the first valid output
    virtual int getLookback() const = 0;

    // Calculate the indicator based on input candle data and store the result.
    // Throws core::IndicatorCalculationException when TA-Lib reports a failure.
    virtual void calculate(const core::TimeSeries<core::Candle>& input) = 0;

    // Same length as the last calculate() input
    virtual const IndicatorSeries& getResult() const = 0;
};

// Initialise the TA-Lib runtime. Call once at startup.
void initialize();
void shutdown();

// Last value of the series, nullopt when empty or still warming up
std::optional<double> latestValue(const IndicatorSeries& series);
std::optional<double> latestValue(const IIndicator& indicator);

std::vector<double> extractSource(const core::TimeSeries<core::Candle>& input, Source source);

// Places TA-Lib's compact output into an input-sized series
IndicatorSeries alignOutput(std::size_t input_size, int out_begin_idx, int out_nb_element,
                            const std::vector<double>& raw);

} // namespace indicators
