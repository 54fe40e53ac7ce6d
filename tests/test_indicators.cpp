#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "sma_indicator.hpp"
#include "ema_indicator.hpp"
#include "rsi_indicator.hpp"
#include "roc_indicator.hpp"
#include "adx_indicator.hpp"
#include "atr_indicator.hpp"
#include <stdexcept>

using test_helpers::makeBars;
using test_helpers::linear;

TEST(IndicatorNamesTest, NamesIncludePeriodAndSource) {
    EXPECT_EQ(indicators::SmaIndicator(100).getName(), "SMA(100)");
    EXPECT_EQ(indicators::SmaIndicator(50, indicators::Source::Volume).getName(), "SMA(Volume,50)");
    EXPECT_EQ(indicators::EmaIndicator(50, indicators::Source::Volume).getName(), "EMA(Volume,50)");
    EXPECT_EQ(indicators::RsiIndicator(2).getName(), "RSI(2)");
    EXPECT_EQ(indicators::RocIndicator(120).getName(), "ROC(120)");
    EXPECT_EQ(indicators::AdxIndicator(10).getName(), "ADX(10)");
    EXPECT_EQ(indicators::AtrIndicator(5).getName(), "ATR(5)");
}

TEST(IndicatorNamesTest, InvalidPeriodsThrow) {
    EXPECT_THROW(indicators::SmaIndicator(0), std::invalid_argument);
    EXPECT_THROW(indicators::RsiIndicator(1), std::invalid_argument);
    EXPECT_THROW(indicators::RocIndicator(-3), std::invalid_argument);
}

TEST(SmaIndicatorTest, AlignedToInputWithWarmup) {
    indicators::SmaIndicator sma(3);
    auto bars = makeBars({1.0, 2.0, 3.0, 4.0, 5.0});
    sma.calculate(bars);

    const auto& result = sma.getResult();
    ASSERT_EQ(result.size(), bars.size());
    EXPECT_FALSE(result[0].has_value());
    EXPECT_FALSE(result[1].has_value());
    ASSERT_TRUE(result[2].has_value());
    EXPECT_NEAR(*result[2], 2.0, 1e-9);
    EXPECT_NEAR(*result[3], 3.0, 1e-9);
    EXPECT_NEAR(*result[4], 4.0, 1e-9);
    EXPECT_NEAR(indicators::latestValue(sma).value(), 4.0, 1e-9);
}

TEST(SmaIndicatorTest, VolumeSource) {
    auto bars = makeBars({10.0, 10.0, 10.0, 10.0}, 1.0, core::Date{2026, 10, 16}, 500000);
    indicators::SmaIndicator sma(2, indicators::Source::Volume);
    sma.calculate(bars);
    EXPECT_NEAR(indicators::latestValue(sma).value(), 500000.0, 1e-6);
}

TEST(SmaIndicatorTest, InsufficientHistoryIsAllUnavailable) {
    indicators::SmaIndicator sma(100);
    auto bars = makeBars(linear(10.0, 1.0, 50));
    sma.calculate(bars);

    ASSERT_EQ(sma.getResult().size(), bars.size());
    for (const auto& value : sma.getResult()) {
        EXPECT_FALSE(value.has_value());
    }
    EXPECT_FALSE(indicators::latestValue(sma).has_value());
}

TEST(EmaIndicatorTest, ConstantInputGivesConstantAverage) {
    auto bars = makeBars(std::vector<double>(20, 42.0));
    indicators::EmaIndicator ema(5);
    ema.calculate(bars);
    EXPECT_NEAR(indicators::latestValue(ema).value(), 42.0, 1e-9);
    EXPECT_FALSE(ema.getResult().front().has_value());
}

TEST(RsiIndicatorTest, StrictlyRisingSeriesIsHundred) {
    indicators::RsiIndicator rsi(2);
    rsi.calculate(makeBars(linear(10.0, 1.0, 30)));
    EXPECT_NEAR(indicators::latestValue(rsi).value(), 100.0, 1e-9);
}

TEST(RsiIndicatorTest, BoundedForMixedSeries) {
    indicators::RsiIndicator rsi(3);
    rsi.calculate(makeBars({10, 11, 10.5, 12, 11, 11.5, 10, 10.2, 10.8, 10.1, 9.9, 10.4}));
    for (const auto& value : rsi.getResult()) {
        if (!value) continue;
        EXPECT_GE(*value, 0.0);
        EXPECT_LE(*value, 100.0);
    }
    EXPECT_TRUE(indicators::latestValue(rsi).has_value());
}

TEST(RocIndicatorTest, FractionalRateOfChange) {
    indicators::RocIndicator roc(2);
    roc.calculate(makeBars({10.0, 15.0, 20.0, 30.0}));

    const auto& result = roc.getResult();
    ASSERT_EQ(result.size(), 4u);
    EXPECT_FALSE(result[1].has_value());
    EXPECT_NEAR(result[2].value(), 1.0, 1e-9);  // 20 / 10 - 1
    EXPECT_NEAR(result[3].value(), 1.0, 1e-9);  // 30 / 15 - 1
}

TEST(RocIndicatorTest, FallingPriceIsNegative) {
    indicators::RocIndicator roc(1);
    roc.calculate(makeBars({20.0, 15.0}));
    EXPECT_NEAR(indicators::latestValue(roc).value(), -0.25, 1e-9);
}

TEST(AtrIndicatorTest, ConstantRangeWithoutGapsEqualsRange) {
    indicators::AtrIndicator atr(3);
    atr.calculate(makeBars(std::vector<double>(15, 50.0), 1.0));
    EXPECT_NEAR(indicators::latestValue(atr).value(), 2.0, 1e-9);
}

TEST(AdxIndicatorTest, BoundedAndWarmsUp) {
    indicators::AdxIndicator adx(4);
    auto bars = makeBars(linear(10.0, 0.5, 40));
    adx.calculate(bars);

    const auto& result = adx.getResult();
    ASSERT_EQ(result.size(), bars.size());
    EXPECT_EQ(adx.getLookback(), 2 * 4 - 1);
    EXPECT_FALSE(result[static_cast<std::size_t>(adx.getLookback()) - 1].has_value());
    auto latest = indicators::latestValue(adx);
    ASSERT_TRUE(latest.has_value());
    EXPECT_GE(*latest, 0.0);
    EXPECT_LE(*latest, 100.0);
}

TEST(IndicatorSeriesTest, AlignOutputPadsLeadingValues) {
    auto aligned = indicators::alignOutput(5, 2, 3, {7.0, 8.0, 9.0});
    ASSERT_EQ(aligned.size(), 5u);
    EXPECT_FALSE(aligned[1].has_value());
    EXPECT_EQ(aligned[2], 7.0);
    EXPECT_EQ(aligned[4], 9.0);
}
