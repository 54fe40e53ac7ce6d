#include "indicators.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>

namespace indicators {

void initialize() {
    TA_RetCode ret_code = TA_Initialize();
    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_Initialize failed with error code: {}", static_cast<int>(ret_code)));
    }
}

void shutdown() {
    TA_RetCode ret_code = TA_Shutdown();
    if (ret_code != TA_SUCCESS) {
        core::logging::getLogger()->warn("TA_Shutdown returned error code: {}", static_cast<int>(ret_code));
    }
}

std::optional<double> latestValue(const IndicatorSeries& series) {
    if (series.empty()) {
        return std::nullopt;
    }
    return series.back();
}

std::optional<double> latestValue(const IIndicator& indicator) {
    return latestValue(indicator.getResult());
}

std::vector<double> extractSource(const core::TimeSeries<core::Candle>& input, Source source) {
    std::vector<double> values;
    values.reserve(input.size());
    for (const auto& candle : input) {
        switch (source) {
            case Source::High:   values.push_back(candle.high); break;
            case Source::Low:    values.push_back(candle.low); break;
            case Source::Volume: values.push_back(static_cast<double>(candle.volume)); break;
            case Source::Close:  values.push_back(candle.close); break;
        }
    }
    return values;
}

IndicatorSeries alignOutput(std::size_t input_size, int out_begin_idx, int out_nb_element,
                            const std::vector<double>& raw) {
    IndicatorSeries aligned(input_size, std::nullopt);
    for (int i = 0; i < out_nb_element; ++i) {
        std::size_t target = static_cast<std::size_t>(out_begin_idx + i);
        if (target >= input_size || static_cast<std::size_t>(i) >= raw.size()) {
            break;
        }
        aligned[target] = raw[static_cast<std::size_t>(i)];
    }
    return aligned;
}

} // namespace indicators
