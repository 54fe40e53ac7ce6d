#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "signal_engine.hpp"
#include "strategy_factory.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <algorithm>
#include <map>

using namespace strategy_engine;
using test_helpers::makeBars;
using test_helpers::linear;

namespace {

    // In-memory provider; records which end dates were requested
    class FakeMarketDataProvider : public data::IMarketDataProvider {
    public:
        core::TimeSeries<core::Candle> getBars(const std::string& symbol, int bar_count,
                                               const core::Date& end_date) override {
            ++bar_requests;
            requested_end_dates[symbol] = end_date;
            auto it = bars.find(symbol);
            if (it == bars.end() || it->second.empty()) {
                throw core::DataUnavailableException("No bars for " + symbol);
            }
            const auto& series = it->second;
            std::size_t count = std::min(series.size(), static_cast<std::size_t>(bar_count));
            return core::TimeSeries<core::Candle>(series.end() - static_cast<long>(count), series.end());
        }

        std::vector<std::string> getUniverse(const std::string& name) override {
            auto it = universes.find(name);
            if (it == universes.end()) throw core::DataUnavailableException("Unknown universe " + name);
            return it->second;
        }

        std::optional<core::Date> latestBarDate(const std::string& symbol) override {
            auto it = bars.find(symbol);
            if (it == bars.end() || it->second.empty()) return std::nullopt;
            return core::utils::parseDate(core::utils::timestampToString(it->second.back().timestamp).substr(0, 10));
        }

        std::map<std::string, core::TimeSeries<core::Candle>> bars;
        std::map<std::string, std::vector<std::string>> universes;
        std::map<std::string, core::Date> requested_end_dates;
        int bar_requests = 0;
    };

    class ThrowingStrategy : public IStrategy {
    public:
        ThrowingStrategy() : config_(defaultStrategyConfig(StrategyKind::Defensive)) { config_.id = "broken"; }
        std::string getName() const override { return config_.id; }
        const StrategyConfig& getConfig() const override { return config_; }
        std::vector<OrderIntent> evaluate(const StrategyInputs&) const override {
            throw core::StrategyException("strategy blew up");
        }
    private:
        StrategyConfig config_;
    };

    const core::Date kToday{2026, 10, 19};

} // end anonymous namespace

TEST(SignalEngineTest, DataEndDateFollowsMonthlyRebalancing) {
    EXPECT_EQ(SignalEngine::dataEndDate(defaultStrategyConfig(StrategyKind::Growth), kToday), (core::Date{2026, 9, 25}));
    EXPECT_EQ(SignalEngine::dataEndDate(defaultStrategyConfig(StrategyKind::MeanReversionLong), kToday), kToday);
}

TEST(SignalEngineTest, ResolvesNamedUniverseOrExplicitList) {
    FakeMarketDataProvider provider;
    provider.universes["NASDAQ 100"] = {"AAPL", "GOOG", "MSFT"};
    SignalEngine engine(defaultEngineConfig(), provider);

    EXPECT_EQ(engine.resolveUniverse(defaultStrategyConfig(StrategyKind::Momentum)),
              (std::vector<std::string>{"AAPL", "GOOG", "MSFT"}));
    EXPECT_EQ(engine.resolveUniverse(defaultStrategyConfig(StrategyKind::Defensive)),
              (std::vector<std::string>{"GLD", "TLT"}));
}

TEST(SignalEngineTest, HeldExcludedSymbolStillGetsExit) {
    FakeMarketDataProvider provider;
    provider.universes["S&P 500"] = {"GOOG"};
    provider.bars["GOOG"] = makeBars(linear(100.0, 0.5, 30), 1.0, kToday);

    std::vector<std::unique_ptr<IStrategy>> strategies;
    strategies.push_back(StrategyFactory::createStrategy(defaultStrategyConfig(StrategyKind::MeanReversionLong)));

    core::Position held;
    held.symbol = "GOOG";
    held.quantity = 40;
    held.average_cost = 95.0;

    SignalEngine engine(defaultEngineConfig(), provider);
    auto results = engine.run(strategies, {{"mr-long", 100000.0}}, {held},
                              core::utils::stringToTimestamp("2026-10-19T18:00:00Z"), kToday);
    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].ok);
    ASSERT_EQ(results[0].intents.size(), 1u);
    EXPECT_EQ(results[0].intents[0].symbol, "GOOG");
    EXPECT_EQ(results[0].intents[0].action, core::SignalAction::ExitLong);
    EXPECT_EQ(results[0].intents[0].quantity, 40);
}

TEST(SignalEngineTest, MarketGateClosedWhenBreadthUnavailable) {
    FakeMarketDataProvider provider;
    SignalEngine engine(defaultEngineConfig(), provider);
    EXPECT_FALSE(engine.marketGateOpen(kToday));

    FakeMarketDataProvider rising;
    rising.bars["#NYSEHL"] = makeBars(linear(-50.0, 5.0, 40));
    SignalEngine bullish(defaultEngineConfig(), rising);
    EXPECT_TRUE(bullish.marketGateOpen(kToday));
}

TEST(SignalEngineTest, FailingStrategyIsIsolated) {
    FakeMarketDataProvider provider;
    provider.bars["IBIT"] = makeBars(linear(40.0, 0.5, 60), 1.0, kToday);

    EngineConfig config = defaultEngineConfig();
    std::vector<std::unique_ptr<IStrategy>> strategies;
    strategies.push_back(std::make_unique<ThrowingStrategy>());
    strategies.push_back(StrategyFactory::createStrategy(defaultStrategyConfig(StrategyKind::Bitcoin)));

    SignalEngine engine(config, provider);
    auto results = engine.run(strategies, {{"broken", 1000.0}, {"btc", 2000.0}}, {},
                              core::utils::stringToTimestamp("2026-10-19T18:00:00Z"), kToday);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].strategy, "broken");
    EXPECT_FALSE(results[0].ok);
    EXPECT_NE(results[0].error.find("blew up"), std::string::npos);

    EXPECT_EQ(results[1].strategy, "btc");
    EXPECT_TRUE(results[1].ok);
    ASSERT_EQ(results[1].intents.size(), 1u);
    EXPECT_EQ(results[1].intents[0].action, core::SignalAction::EnterLong);
    EXPECT_GT(results[1].intents[0].quantity, 0);
}

TEST(SignalEngineTest, MissingBudgetFailsThatStrategyOnly) {
    FakeMarketDataProvider provider;
    std::vector<std::unique_ptr<IStrategy>> strategies;
    strategies.push_back(StrategyFactory::createStrategy(defaultStrategyConfig(StrategyKind::Defensive)));

    SignalEngine engine(defaultEngineConfig(), provider);
    auto results = engine.run(strategies, {}, {}, core::utils::stringToTimestamp("2026-10-19T18:00:00Z"), kToday);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].ok);
}

TEST(SignalEngineTest, UnknownUniverseFailsStrategy) {
    FakeMarketDataProvider provider;
    std::vector<std::unique_ptr<IStrategy>> strategies;
    strategies.push_back(StrategyFactory::createStrategy(defaultStrategyConfig(StrategyKind::MeanReversionLong)));

    SignalEngine engine(defaultEngineConfig(), provider);
    auto results = engine.run(strategies, {{"mr-long", 1000.0}}, {},
                              core::utils::stringToTimestamp("2026-10-19T18:00:00Z"), kToday);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].ok);
}

TEST(SignalEngineTest, MissingSymbolDataIsSkipped) {
    FakeMarketDataProvider provider;
    provider.bars["GLD"] = makeBars(linear(100.0, 0.5, 260), 1.0, core::Date{2026, 9, 25});

    std::vector<std::unique_ptr<IStrategy>> strategies;
    strategies.push_back(StrategyFactory::createStrategy(defaultStrategyConfig(StrategyKind::Defensive)));

    SignalEngine engine(defaultEngineConfig(), provider);
    auto results = engine.run(strategies, {{"def", 10000.0}}, {},
                              core::utils::stringToTimestamp("2026-10-19T18:00:00Z"), kToday);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].ok);
    ASSERT_EQ(results[0].intents.size(), 1u);
    EXPECT_EQ(results[0].intents[0].symbol, "GLD");
    EXPECT_EQ(provider.requested_end_dates["GLD"], (core::Date{2026, 9, 25}));
}

TEST(SignalEngineTest, BarsAreFetchedOncePerSymbolAndEndDate) {
    FakeMarketDataProvider provider;
    provider.bars["IBIT"] = makeBars(linear(40.0, 0.5, 60), 1.0, kToday);

    auto first = defaultStrategyConfig(StrategyKind::Bitcoin);
    auto second = first;
    second.id = "btc-2";

    std::vector<std::unique_ptr<IStrategy>> strategies;
    strategies.push_back(StrategyFactory::createStrategy(first));
    strategies.push_back(StrategyFactory::createStrategy(second));

    SignalEngine engine(defaultEngineConfig(), provider);
    auto results = engine.run(strategies, {{"btc", 1000.0}, {"btc-2", 1000.0}}, {},
                              core::utils::stringToTimestamp("2026-10-19T18:00:00Z"), kToday);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].ok);
    EXPECT_TRUE(results[1].ok);
    EXPECT_EQ(provider.bar_requests, 1);
}

TEST(MarketDataProviderTest, FreshnessCheck) {
    FakeMarketDataProvider provider;
    provider.bars["SPY"] = makeBars(linear(400.0, 1.0, 5), 1.0, core::Date{2026, 10, 16});
    EXPECT_NO_THROW(provider.checkFreshness("SPY", kToday));  // Friday is the previous trading day
    EXPECT_THROW(provider.checkFreshness("SPY", core::Date{2026, 10, 21}), core::DataUnavailableException);
    EXPECT_THROW(provider.checkFreshness("QQQ", kToday), core::DataUnavailableException);
}
