#pragma once

#include "interfaces.hpp"
#include <string>
#include <vector>

namespace strategy_engine {

    struct RankedCandidate {
        std::string symbol;
        double score = 0.0;
        MarketDataSnapshot snapshot;
    };

    // Descending score, ties broken by ascending symbol. Deterministic total order.
    void rankCandidates(std::vector<RankedCandidate>& candidates);

    struct HysteresisSelection {
        std::vector<std::string> hold;    // Top worst_rank: held symbols here are kept
        std::vector<std::string> entries; // Top max_positions: new entries come from here
    };

    // `ranked` must already be ordered by rankCandidates()
    HysteresisSelection selectWithHysteresis(const std::vector<RankedCandidate>& ranked,
                                             int max_positions, int worst_rank);

} // namespace strategy_engine
