#include "price_utils.hpp"
#include <cmath>

namespace indicators {

double ibr(double high, double low, double close) {
    double range = high - low;
    if (range == 0.0) {
        return 0.5;
    }
    return (close - low) / range;
}

double ibr(const core::Candle& candle) {
    return ibr(candle.high, candle.low, candle.close);
}

double tickSize(double price) {
    if (price < 0.10) return 0.001;
    if (price < 2.0) return 0.005;
    return 0.01;
}

double roundToTick(double price) {
    return roundToTick(price, tickSize(price));
}

double roundToTick(double price, double tick) {
    return std::round(price / tick) * tick;
}

int tickDecimals(double price) {
    return tickSize(price) < 0.01 ? 3 : 2;
}

} // namespace indicators
