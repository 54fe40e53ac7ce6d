#include <gtest/gtest.h>
#include "ranking.hpp"
#include <algorithm>
#include <random>

using namespace strategy_engine;

namespace {

    std::vector<RankedCandidate> candidates(const std::vector<std::pair<std::string, double>>& scores) {
        std::vector<RankedCandidate> list;
        for (const auto& [symbol, score] : scores) {
            RankedCandidate candidate;
            candidate.symbol = symbol;
            candidate.score = score;
            list.push_back(candidate);
        }
        return list;
    }

    std::vector<std::string> symbols(const std::vector<RankedCandidate>& list) {
        std::vector<std::string> out;
        for (const auto& c : list) out.push_back(c.symbol);
        return out;
    }

} // end anonymous namespace

TEST(RankingTest, DescendingScoreWithSymbolTieBreak) {
    auto list = candidates({{"MSFT", 0.2}, {"AAPL", 0.5}, {"NVDA", 0.2}, {"AMZN", 0.2}, {"META", 0.9}});
    rankCandidates(list);
    EXPECT_EQ(symbols(list), (std::vector<std::string>{"META", "AAPL", "AMZN", "MSFT", "NVDA"}));
}

TEST(RankingTest, OrderIndependentOfInputOrder) {
    auto list = candidates({{"D", 1.0}, {"B", 1.0}, {"A", 2.0}, {"C", 1.0}, {"E", 0.5}});
    auto shuffled = list;
    std::mt19937 rng(7);
    std::shuffle(shuffled.begin(), shuffled.end(), rng);

    rankCandidates(list);
    rankCandidates(shuffled);
    EXPECT_EQ(symbols(list), symbols(shuffled));
}

TEST(HysteresisTest, HoldBufferIsWiderThanEntrySet) {
    auto list = candidates({{"A", 6.0}, {"B", 5.0}, {"C", 4.0}, {"D", 3.0}, {"E", 2.0}, {"F", 1.0}});
    rankCandidates(list);
    auto selection = selectWithHysteresis(list, 3, 5);
    EXPECT_EQ(selection.entries, (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_EQ(selection.hold, (std::vector<std::string>{"A", "B", "C", "D", "E"}));
}

TEST(HysteresisTest, FewerCandidatesThanThresholds) {
    auto list = candidates({{"QQQ", 0.3}});
    auto selection = selectWithHysteresis(list, 1, 2);
    EXPECT_EQ(selection.entries, (std::vector<std::string>{"QQQ"}));
    EXPECT_EQ(selection.hold, (std::vector<std::string>{"QQQ"}));
}
