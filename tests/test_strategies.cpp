#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "engine_config.hpp"
#include "rotation_strategy.hpp"
#include "trend_hold_strategy.hpp"
#include "mean_reversion_strategy.hpp"
#include "intraday_reversion_strategy.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

using namespace strategy_engine;
using test_helpers::makeSnapshot;
using test_helpers::makeBars;
using test_helpers::linear;

namespace {

    core::Position position(const std::string& symbol, long long quantity) {
        core::Position p;
        p.symbol = symbol;
        p.quantity = quantity;
        p.average_cost = 10.0;
        return p;
    }

    const OrderIntent* findIntent(const std::vector<OrderIntent>& intents, const std::string& symbol,
                                  core::SignalAction action) {
        for (const auto& intent : intents) {
            if (intent.symbol == symbol && intent.action == action) return &intent;
        }
        return nullptr;
    }

    // Passes every mr-long filter: Close 50 > SMA(100) 45, ADX(10) 32, RSI(2) 25, avg volume 500k
    MarketDataSnapshot meanReversionLongSetup(const std::string& symbol) {
        return makeSnapshot(symbol, 50.5, 51.0, 49.0, 50.0, 250,
                            {{"SMA(100)", 45.0}, {"ADX(10)", 32.0}, {"RSI(2)", 25.0}, {"ATR(10)", 1.0},
                             {"SMA(Volume,50)", 500000.0}, {"Volatility", 2.0}, {"IBR", 0.5}});
    }

    MarketDataSnapshot momentumSetup(const std::string& symbol, double score) {
        return makeSnapshot(symbol, 100.0, 101.0, 99.0, 100.0, 251,
                            {{"SMA(100)", 90.0}, {"Score", score}, {"IBR", 0.5}});
    }

    MarketDataSnapshot hftLongSetup(const std::string& symbol, double volatility, double ibr = 0.2) {
        return makeSnapshot(symbol, 101.0, 102.0, 99.0, 100.0, 252,
                            {{"SMA(250)", 90.0}, {"ADX(4)", 40.0}, {"ATR(5)", 2.0}, {"IBR", ibr},
                             {"EMA(Volume,50)", 3000000.0}, {"Volatility", volatility}});
    }

} // end anonymous namespace

// --- Mean reversion ---

TEST(MeanReversionStrategyTest, LongSetupEmitsStretchedGtcLimit) {
    MeanReversionStrategy strategy(defaultStrategyConfig(StrategyKind::MeanReversionLong));
    StrategyInputs inputs;
    inputs.universe = {"AAPL"};
    inputs.budget = 100000.0;

    auto intents = strategy.evaluateSnapshots({meanReversionLongSetup("AAPL")}, inputs);
    ASSERT_EQ(intents.size(), 1u);
    const auto& intent = intents[0];
    EXPECT_EQ(intent.symbol, "AAPL");
    EXPECT_EQ(intent.action, core::SignalAction::EnterLong);
    EXPECT_EQ(intent.order_type, OrderType::Limit);
    EXPECT_NEAR(intent.limit_price, 48.50, 1e-9);   // Low 49 - 0.5 * ATR 1.0
    EXPECT_EQ(intent.time_in_force, TimeInForce::Gtc);
    EXPECT_EQ(intent.quantity, 206);                 // floor(100000 / 10 / 48.50)
}

TEST(MeanReversionStrategyTest, LimitUsesTickOfBarLow) {
    StrategyConfig config = defaultStrategyConfig(StrategyKind::MeanReversionLong);
    config.min_price = 1.0;
    MeanReversionStrategy strategy(config);
    StrategyInputs inputs;
    inputs.universe = {"PENNY"};
    inputs.budget = 100000.0;

    // Low 2.00 - 0.5 * 0.068 = 1.966: cent tick of the low gives 1.97, not 1.965
    auto setup = makeSnapshot("PENNY", 2.4, 2.6, 2.0, 2.5, 250,
                              {{"SMA(100)", 2.2}, {"ADX(10)", 32.0}, {"RSI(2)", 25.0}, {"ATR(10)", 0.068},
                               {"SMA(Volume,50)", 500000.0}, {"Volatility", 2.7}, {"IBR", 0.8}});
    auto intents = strategy.evaluateSnapshots({setup}, inputs);
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_NEAR(intents[0].limit_price, 1.97, 1e-9);
}

TEST(MeanReversionStrategyTest, FailingFilterExcludesSymbol) {
    MeanReversionStrategy strategy(defaultStrategyConfig(StrategyKind::MeanReversionLong));
    StrategyInputs inputs;
    inputs.universe = {"AAPL", "MSFT", "TSLA", "XOM"};
    inputs.budget = 100000.0;

    auto rsi_high = meanReversionLongSetup("MSFT");
    rsi_high.indicator_values["RSI(2)"] = 35.0;
    auto below_trend = meanReversionLongSetup("TSLA");
    below_trend.indicator_values["SMA(100)"] = 55.0;
    auto short_history = meanReversionLongSetup("XOM");
    short_history.bar_count = 150;

    auto intents = strategy.evaluateSnapshots({meanReversionLongSetup("AAPL"), rsi_high, below_trend, short_history},
                                              inputs);
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].symbol, "AAPL");
}

TEST(MeanReversionStrategyTest, ExcludedSymbolIsNeverEntered) {
    MeanReversionStrategy strategy(defaultStrategyConfig(StrategyKind::MeanReversionLong));
    StrategyInputs inputs;
    inputs.universe = {"AAPL", "GOOG"};
    inputs.budget = 100000.0;
    inputs.excluded = {"GOOG"};

    auto intents = strategy.evaluateSnapshots({meanReversionLongSetup("AAPL"), meanReversionLongSetup("GOOG")}, inputs);
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].symbol, "AAPL");
}

TEST(MeanReversionStrategyTest, HeldLongGetsExitAtHighAndIsNotReentered) {
    MeanReversionStrategy strategy(defaultStrategyConfig(StrategyKind::MeanReversionLong));
    StrategyInputs inputs;
    inputs.universe = {"AAPL"};
    inputs.budget = 100000.0;
    inputs.positions = {position("AAPL", 100)};

    auto intents = strategy.evaluateSnapshots({meanReversionLongSetup("AAPL")}, inputs);
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].action, core::SignalAction::ExitLong);
    EXPECT_EQ(intents[0].quantity, 100);
    EXPECT_NEAR(intents[0].limit_price, 51.0, 1e-9);
    EXPECT_EQ(intents[0].time_in_force, TimeInForce::Gtc);
}

TEST(MeanReversionStrategyTest, ShortSideEntriesAndCovers) {
    MeanReversionStrategy strategy(defaultStrategyConfig(StrategyKind::MeanReversionShort));
    StrategyInputs inputs;
    inputs.universe = {"XYZ", "ABC", "LNG"};
    inputs.budget = 100000.0;
    inputs.positions = {position("ABC", -30), position("LNG", 25)};

    auto overbought = makeSnapshot("XYZ", 50.5, 51.0, 49.0, 50.0, 250,
                                   {{"SMA(100)", 45.0}, {"ADX(10)", 32.0}, {"RSI(3)", 95.0}, {"ATR(10)", 1.0},
                                    {"SMA(Volume,50)", 500000.0}, {"Volatility", 2.0}});
    auto held = makeSnapshot("ABC", 21.0, 22.0, 20.0, 21.0, 250, {});
    auto long_held = makeSnapshot("LNG", 30.0, 31.0, 29.0, 30.0, 250, {});

    auto intents = strategy.evaluateSnapshots({overbought, held, long_held}, inputs);
    ASSERT_EQ(intents.size(), 2u);

    const auto* cover = findIntent(intents, "ABC", core::SignalAction::ExitShort);
    ASSERT_NE(cover, nullptr);
    EXPECT_EQ(cover->quantity, 30);
    EXPECT_NEAR(cover->limit_price, 20.0, 1e-9);

    const auto* entry = findIntent(intents, "XYZ", core::SignalAction::EnterShort);
    ASSERT_NE(entry, nullptr);
    EXPECT_NEAR(entry->limit_price, 51.80, 1e-9);   // High 51 + 0.8 * ATR 1.0
    EXPECT_EQ(findIntent(intents, "LNG", core::SignalAction::ExitShort), nullptr);
}

TEST(MeanReversionStrategyTest, SlotsShrinkWithHeldPositions) {
    auto config = defaultStrategyConfig(StrategyKind::MeanReversionLong);
    config.max_positions = 2;
    MeanReversionStrategy strategy(config);

    StrategyInputs inputs;
    inputs.universe = {"AAA", "BBB", "CCC"};
    inputs.budget = 100000.0;
    inputs.positions = {position("CCC", 10)};

    auto low_vol = meanReversionLongSetup("AAA");
    low_vol.indicator_values["Volatility"] = 1.0;
    auto high_vol = meanReversionLongSetup("BBB");
    high_vol.indicator_values["Volatility"] = 3.0;
    auto held = meanReversionLongSetup("CCC");

    auto intents = strategy.evaluateSnapshots({low_vol, high_vol, held}, inputs);
    ASSERT_EQ(intents.size(), 2u);
    EXPECT_NE(findIntent(intents, "CCC", core::SignalAction::ExitLong), nullptr);
    EXPECT_NE(findIntent(intents, "BBB", core::SignalAction::EnterLong), nullptr);
    EXPECT_EQ(findIntent(intents, "AAA", core::SignalAction::EnterLong), nullptr);
}

TEST(MeanReversionStrategyTest, BudgetTooSmallDropsEntry) {
    MeanReversionStrategy strategy(defaultStrategyConfig(StrategyKind::MeanReversionLong));
    StrategyInputs inputs;
    inputs.universe = {"AAPL"};
    inputs.budget = 100.0;
    EXPECT_TRUE(strategy.evaluateSnapshots({meanReversionLongSetup("AAPL")}, inputs).empty());
}

TEST(MeanReversionStrategyTest, EntriesDisabledKeepsExits) {
    auto config = defaultStrategyConfig(StrategyKind::MeanReversionLong);
    config.entry_allowed = false;
    MeanReversionStrategy strategy(config);

    StrategyInputs inputs;
    inputs.universe = {"AAPL", "HELD"};
    inputs.budget = 100000.0;
    inputs.positions = {position("HELD", 5)};

    auto intents = strategy.evaluateSnapshots({meanReversionLongSetup("AAPL"), meanReversionLongSetup("HELD")}, inputs);
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].action, core::SignalAction::ExitLong);
}

// --- Rotation ---

TEST(RotationStrategyTest, HysteresisKeepsBufferAndExitsTheRest) {
    RotationStrategy strategy(defaultStrategyConfig(StrategyKind::Momentum));
    StrategyInputs inputs;
    inputs.universe = {"A", "B", "C", "D", "E", "F"};
    inputs.budget = 30000.0;
    inputs.market_gate_open = true;
    inputs.positions = {position("A", 20), position("D", 15), position("F", 40)};

    std::vector<MarketDataSnapshot> snapshots = {
        momentumSetup("A", 0.6), momentumSetup("B", 0.5), momentumSetup("C", 0.4),
        momentumSetup("D", 0.3), momentumSetup("E", 0.2), momentumSetup("F", -0.1)};

    auto intents = strategy.evaluateSnapshots(snapshots, inputs);
    ASSERT_EQ(intents.size(), 3u);

    const auto* exit = findIntent(intents, "F", core::SignalAction::ExitLong);
    ASSERT_NE(exit, nullptr);
    EXPECT_EQ(exit->quantity, 40);
    EXPECT_EQ(exit->order_type, OrderType::Market);
    EXPECT_EQ(exit->time_in_force, TimeInForce::Day);

    const auto* entry = findIntent(intents, "B", core::SignalAction::EnterLong);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->quantity, 100);  // floor(30000 / 3 / 100)
    EXPECT_NE(findIntent(intents, "C", core::SignalAction::EnterLong), nullptr);
    EXPECT_EQ(findIntent(intents, "D", core::SignalAction::ExitLong), nullptr);
    EXPECT_EQ(findIntent(intents, "A", core::SignalAction::EnterLong), nullptr);
}

TEST(RotationStrategyTest, ClosedMarketGateSuppressesOnlyEntries) {
    RotationStrategy strategy(defaultStrategyConfig(StrategyKind::Momentum));
    StrategyInputs inputs;
    inputs.universe = {"A", "B", "F"};
    inputs.budget = 30000.0;
    inputs.market_gate_open = false;
    inputs.positions = {position("F", 40)};

    auto intents = strategy.evaluateSnapshots(
        {momentumSetup("A", 0.6), momentumSetup("B", 0.5), momentumSetup("F", -0.1)}, inputs);
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].symbol, "F");
    EXPECT_EQ(intents[0].action, core::SignalAction::ExitLong);
}

TEST(RotationStrategyTest, GrowthBuysTopScorerFromBars) {
    RotationStrategy strategy(defaultStrategyConfig(StrategyKind::Growth));
    StrategyInputs inputs;
    inputs.universe = {"QQQ", "SPY", "IOO"};
    inputs.budget = 10000.0;
    inputs.bars["QQQ"] = makeBars(linear(100.0, 0.5, 260));
    inputs.bars["SPY"] = makeBars(linear(100.0, 0.2, 260));
    inputs.bars["IOO"] = makeBars(linear(300.0, -0.5, 260));

    auto intents = strategy.evaluate(inputs);
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].symbol, "QQQ");
    EXPECT_EQ(intents[0].action, core::SignalAction::EnterLong);
    EXPECT_EQ(intents[0].quantity, 43);  // floor(10000 / 229.5)
}

// --- Trend hold ---

TEST(TrendHoldStrategyTest, BuysOnUptrendAndSellsWhenItBreaks) {
    TrendHoldStrategy strategy(defaultStrategyConfig(StrategyKind::Bitcoin));
    StrategyInputs inputs;
    inputs.universe = {"IBIT"};
    inputs.budget = 2000.0;

    auto uptrend = makeSnapshot("IBIT", 50.0, 51.0, 49.0, 50.0, 50, {{"UptrendBars", 4.0}});
    auto intents = strategy.evaluateSnapshots({uptrend}, inputs);
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].action, core::SignalAction::EnterLong);
    EXPECT_EQ(intents[0].quantity, 40);

    inputs.positions = {position("IBIT", 10)};
    EXPECT_TRUE(strategy.evaluateSnapshots({uptrend}, inputs).empty());

    auto broken = makeSnapshot("IBIT", 50.0, 51.0, 49.0, 50.0, 50, {{"UptrendBars", 1.0}});
    intents = strategy.evaluateSnapshots({broken}, inputs);
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].action, core::SignalAction::ExitLong);
    EXPECT_EQ(intents[0].quantity, 10);
}

TEST(TrendHoldStrategyTest, UptrendCountedFromBars) {
    TrendHoldStrategy strategy(defaultStrategyConfig(StrategyKind::Bitcoin));
    auto snapshot = strategy.buildSnapshot("IBIT", makeBars(linear(40.0, 0.5, 50)));
    ASSERT_TRUE(snapshot.get("UptrendBars").has_value());
    EXPECT_DOUBLE_EQ(*snapshot.get("UptrendBars"), 10.0);  // ROC(40) defined on the last 10 bars
}

// --- Intraday reversion ---

TEST(IntradayReversionStrategyTest, LongEntryIsGtdWithMoc) {
    IntradayReversionStrategy strategy(defaultStrategyConfig(StrategyKind::HftLong));
    StrategyInputs inputs;
    inputs.universe = {"NVDA", "AMD", "HELD"};
    inputs.budget = 150000.0;
    inputs.now = core::utils::stringToTimestamp("2026-10-19T18:00:00Z");
    inputs.positions = {position("HELD", 10)};

    auto intents = strategy.evaluateSnapshots(
        {hftLongSetup("NVDA", 2.0), hftLongSetup("AMD", 3.0, 0.5), hftLongSetup("HELD", 4.0)}, inputs);
    ASSERT_EQ(intents.size(), 1u);
    const auto& intent = intents[0];
    EXPECT_EQ(intent.symbol, "NVDA");
    EXPECT_NEAR(intent.limit_price, 97.80, 1e-9);   // Low 99 - 0.6 * ATR 2
    EXPECT_EQ(intent.time_in_force, TimeInForce::Gtd);
    EXPECT_EQ(intent.good_till_date, "2026-10-19T15:44:00");
    EXPECT_TRUE(intent.attach_moc);
    EXPECT_EQ(intent.quantity, 102);                 // floor(150000 / 15 / 97.80)
}

TEST(IntradayReversionStrategyTest, RanksByVolatilityAndCapsAtK) {
    auto config = defaultStrategyConfig(StrategyKind::HftLong);
    config.max_positions = 2;
    IntradayReversionStrategy strategy(config);
    StrategyInputs inputs;
    inputs.universe = {"A", "B", "C"};
    inputs.budget = 100000.0;
    inputs.now = core::utils::stringToTimestamp("2026-10-19T20:00:00Z");

    auto intents = strategy.evaluateSnapshots({hftLongSetup("A", 1.0), hftLongSetup("B", 3.0), hftLongSetup("C", 2.0)},
                                              inputs);
    ASSERT_EQ(intents.size(), 2u);
    EXPECT_EQ(intents[0].symbol, "B");
    EXPECT_EQ(intents[1].symbol, "C");
    EXPECT_EQ(intents[0].good_till_date, "2026-10-20T15:44:00");
}

TEST(IntradayReversionStrategyTest, PriceBandBoundsAreInclusive) {
    IntradayReversionStrategy strategy(defaultStrategyConfig(StrategyKind::HftLong));
    StrategyInputs inputs;
    inputs.universe = {"CAP", "FLOOR", "ABOVE", "BELOW"};
    inputs.budget = 1.0e9;
    inputs.now = core::utils::stringToTimestamp("2026-10-19T18:00:00Z");

    auto band_setup = [](const std::string& symbol, double close) {
        return makeSnapshot(symbol, close, close * 1.002, close * 0.998, close, 252,
                            {{"SMA(250)", close * 0.8}, {"ADX(4)", 40.0}, {"ATR(5)", close * 0.004},
                             {"IBR", 0.2}, {"EMA(Volume,50)", 3000000.0}, {"Volatility", 0.4}});
    };

    auto intents = strategy.evaluateSnapshots(
        {band_setup("CAP", 5000.0), band_setup("FLOOR", 10.0), band_setup("ABOVE", 5000.01),
         band_setup("BELOW", 9.99)}, inputs);

    EXPECT_NE(findIntent(intents, "CAP", core::SignalAction::EnterLong), nullptr);
    EXPECT_NE(findIntent(intents, "FLOOR", core::SignalAction::EnterLong), nullptr);
    EXPECT_EQ(findIntent(intents, "ABOVE", core::SignalAction::EnterLong), nullptr);
    EXPECT_EQ(findIntent(intents, "BELOW", core::SignalAction::EnterLong), nullptr);
}

TEST(MeanReversionStrategyTest, MinimumPriceStaysStrict) {
    MeanReversionStrategy strategy(defaultStrategyConfig(StrategyKind::MeanReversionLong));
    StrategyInputs inputs;
    inputs.universe = {"FIVE"};
    inputs.budget = 100000.0;

    auto at_floor = makeSnapshot("FIVE", 5.05, 5.1, 4.9, 5.0, 250,
                                 {{"SMA(100)", 4.5}, {"ADX(10)", 32.0}, {"RSI(2)", 25.0}, {"ATR(10)", 0.1},
                                  {"SMA(Volume,50)", 500000.0}, {"Volatility", 2.0}, {"IBR", 0.5}});
    EXPECT_TRUE(strategy.evaluateSnapshots({at_floor}, inputs).empty());
}

TEST(IntradayReversionStrategyTest, ShortUsesHighStretch) {
    IntradayReversionStrategy strategy(defaultStrategyConfig(StrategyKind::HftShort));
    StrategyInputs inputs;
    inputs.universe = {"TSLA"};
    inputs.budget = 150000.0;
    inputs.now = core::utils::stringToTimestamp("2026-10-19T18:00:00Z");

    auto intents = strategy.evaluateSnapshots({hftLongSetup("TSLA", 2.0, 0.9)}, inputs);
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].action, core::SignalAction::EnterShort);
    EXPECT_NEAR(intents[0].limit_price, 102.60, 1e-9);  // High 102 + 0.3 * ATR 2
}

// --- Snapshot construction ---

TEST(StrategySnapshotTest, BuildSnapshotCarriesBarValuesAndAvailableIndicators) {
    MeanReversionStrategy strategy(defaultStrategyConfig(StrategyKind::MeanReversionLong));
    auto bars = makeBars(linear(20.0, 0.5, 30));
    auto snapshot = strategy.buildSnapshot("AAPL", bars);

    EXPECT_EQ(snapshot.bar_count, 30u);
    EXPECT_DOUBLE_EQ(snapshot.get("Close").value(), bars.back().close);
    EXPECT_DOUBLE_EQ(snapshot.get("IBR").value(), 0.5);
    EXPECT_TRUE(snapshot.get("RSI(2)").has_value());
    EXPECT_TRUE(snapshot.get("ATR(10)").has_value());
    EXPECT_TRUE(snapshot.get("Volatility").has_value());
    EXPECT_FALSE(snapshot.get("SMA(100)").has_value());   // Still warming up
}

TEST(StrategySnapshotTest, EmptyBarsThrow) {
    MeanReversionStrategy strategy(defaultStrategyConfig(StrategyKind::MeanReversionLong));
    EXPECT_THROW(strategy.buildSnapshot("AAPL", {}), core::DataUnavailableException);
}
