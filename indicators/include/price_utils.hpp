#pragma once

#include "datatypes.hpp"

namespace indicators {

    // Internal bar range: where the close sits between low (0) and high (1).
    // A zero-range bar yields 0.5.
    double ibr(double high, double low, double close);
    double ibr(const core::Candle& candle);

    // Minimum price increment: 0.01, 0.005 below $2, 0.001 below $0.10
    double tickSize(double price);

    double roundToTick(double price);

    // Rounds to a given increment, e.g. the tick of a reference price
    double roundToTick(double price, double tick);

    // Decimal places needed to print a price at its tick (2 or 3)
    int tickDecimals(double price);

} // namespace indicators
