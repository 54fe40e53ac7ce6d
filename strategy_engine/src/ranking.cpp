#include "ranking.hpp"
#include <algorithm>

namespace strategy_engine {

void rankCandidates(std::vector<RankedCandidate>& candidates) {
    std::sort(candidates.begin(), candidates.end(),
              [](const RankedCandidate& a, const RankedCandidate& b) {
                  if (a.score != b.score) return a.score > b.score;
                  return a.symbol < b.symbol;
              });
}

HysteresisSelection selectWithHysteresis(const std::vector<RankedCandidate>& ranked,
                                         int max_positions, int worst_rank) {
    HysteresisSelection selection;
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        int rank = static_cast<int>(i) + 1;
        if (rank <= worst_rank) selection.hold.push_back(ranked[i].symbol);
        if (rank <= max_positions) selection.entries.push_back(ranked[i].symbol);
    }
    return selection;
}

} // namespace strategy_engine
