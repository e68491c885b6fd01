#include "sma_indicator.hpp"
#include "rsi_indicator.hpp"
#include "bollinger_bands_indicator.hpp"
#include "adx_indicator.hpp"
#include "stddev_indicator.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

using test_helpers::series;

namespace {

    std::vector<double> risingCloses(int n) {
        std::vector<double> closes;
        for (int i = 0; i < n; ++i) closes.push_back(100.0 + i);
        return closes;
    }

} // namespace

TEST(SmaIndicatorTest, AlignsResultsWithLookback) {
    indicators::SmaIndicator sma(3);
    EXPECT_EQ(sma.getName(), "SMA(3)");
    EXPECT_EQ(sma.getLookback(), 2);

    sma.calculate(series({1, 2, 3, 4, 5}));
    const auto& result = sma.getResult();
    ASSERT_EQ(result.size(), 3u);
    EXPECT_NEAR(result[0], 2.0, 1e-9);
    EXPECT_NEAR(result[1], 3.0, 1e-9);
    EXPECT_NEAR(result[2], 4.0, 1e-9);
}

TEST(SmaIndicatorTest, InsufficientInputGivesEmptyResult) {
    indicators::SmaIndicator sma(5);
    sma.calculate(series({1, 2, 3}));
    EXPECT_TRUE(sma.getResult().empty());
}

TEST(SmaIndicatorTest, RejectsNonPositivePeriod) {
    EXPECT_THROW(indicators::SmaIndicator(0), std::invalid_argument);
}

TEST(RsiIndicatorTest, RollingMeanOfGainsAndLosses) {
    indicators::RsiIndicator rsi(2);
    EXPECT_EQ(rsi.getLookback(), 1);

    rsi.calculate(series({10, 9, 8, 7, 6, 20}));
    const auto& result = rsi.getResult();
    ASSERT_EQ(result.size(), 5u);
    EXPECT_NEAR(result[0], 0.0, 1e-9);
    EXPECT_NEAR(result[3], 0.0, 1e-9);
    // avg gain 7, avg loss 0.5
    EXPECT_NEAR(result[4], 100.0 * 7.0 / 7.5, 1e-9);
}

TEST(RsiIndicatorTest, LossesDropOutOfTheWindow) {
    indicators::RsiIndicator rsi(3);
    rsi.calculate(series({10, 11, 12, 13, 10, 10}));
    const auto& result = rsi.getResult();
    ASSERT_EQ(result.size(), 4u);
    EXPECT_NEAR(result[0], 100.0, 1e-9); // No losses yet
    EXPECT_NEAR(result[2], 40.0, 1e-9);  // gains (1, 1, 0), losses (0, 0, 3)
    // gains (1, 0, 0), losses (0, 3, 0)
    EXPECT_NEAR(result[3], 25.0, 1e-9);
}

TEST(RsiIndicatorTest, FlatWindowIsUndefined) {
    indicators::RsiIndicator rsi(3);
    rsi.calculate(series(std::vector<double>(6, 50.0)));
    ASSERT_EQ(rsi.getResult().size(), 4u);
    EXPECT_TRUE(std::isnan(rsi.getResult().back()));
}

TEST(RsiIndicatorTest, RejectsTooShortPeriod) {
    EXPECT_THROW(indicators::RsiIndicator(1), std::invalid_argument);
}

TEST(BollingerBandsIndicatorTest, SampleStdBands) {
    indicators::BollingerBandsIndicator bands(10, 2.0);
    EXPECT_EQ(bands.getLookback(), 9);

    bands.calculate(series({100, 100, 100, 100, 100, 100, 100, 100, 100, 80}));
    ASSERT_EQ(bands.getMiddleBand().size(), 1u);
    // Squared deviations sum to 360 over 9 degrees of freedom
    EXPECT_NEAR(bands.getMiddleBand().back(), 98.0, 1e-9);
    EXPECT_NEAR(bands.getUpperBand().back(), 98.0 + 2.0 * std::sqrt(40.0), 1e-6);
    EXPECT_NEAR(bands.getLowerBand().back(), 98.0 - 2.0 * std::sqrt(40.0), 1e-6);
    EXPECT_EQ(&bands.getResult(), &bands.getMiddleBand());
}

TEST(BollingerBandsIndicatorTest, ShortWindowUsesSampleDeviation) {
    indicators::BollingerBandsIndicator bands(3, 1.2);
    bands.calculate(series({12, 12, 9}));
    ASSERT_EQ(bands.getLowerBand().size(), 1u);
    EXPECT_NEAR(bands.getLowerBand().back(), 11.0 - 1.2 * std::sqrt(3.0), 1e-6);
    EXPECT_GT(9.0, bands.getLowerBand().back());
}

TEST(BollingerBandsIndicatorTest, RejectsBadParameters) {
    EXPECT_THROW(indicators::BollingerBandsIndicator(1, 2.0), std::invalid_argument);
    EXPECT_THROW(indicators::BollingerBandsIndicator(20, 0.0), std::invalid_argument);
}

TEST(AdxIndicatorTest, StrongUptrendSaturates) {
    indicators::AdxIndicator adx(3);
    EXPECT_EQ(adx.getLookback(), 4);

    adx.calculate(series(risingCloses(10)));
    const auto& result = adx.getResult();
    ASSERT_EQ(result.size(), 6u);
    EXPECT_NEAR(result.front(), 100.0, 1e-6);
    EXPECT_NEAR(result.back(), 100.0, 1e-6);
}

TEST(AdxIndicatorTest, ChoppyMarketAveragesDirectionalIndex) {
    indicators::AdxIndicator adx(3);
    std::vector<double> closes;
    for (int i = 0; i < 10; ++i) closes.push_back(i % 2 == 0 ? 100.0 : 101.0);
    adx.calculate(series(closes));
    const auto& result = adx.getResult();
    ASSERT_EQ(result.size(), 6u);
    // DX is 0 on the third bar, then 100/3 once both directions share the window
    EXPECT_NEAR(result[0], 200.0 / 9.0, 1e-6);
    EXPECT_NEAR(result.back(), 100.0 / 3.0, 1e-6);
}

TEST(AdxIndicatorTest, FlatMarketIsUndefined) {
    indicators::AdxIndicator adx(3);
    adx.calculate(series(std::vector<double>(10, 100.0)));
    ASSERT_FALSE(adx.getResult().empty());
    EXPECT_TRUE(std::isnan(adx.getResult().back()));
}

TEST(StdDevIndicatorTest, SampleStandardDeviation) {
    indicators::StdDevIndicator stddev(8);
    stddev.calculate(series({2, 4, 4, 4, 5, 5, 7, 9}));
    ASSERT_EQ(stddev.getResult().size(), 1u);
    EXPECT_NEAR(stddev.getResult().back(), std::sqrt(32.0 / 7.0), 1e-9);
}

TEST(IndicatorLookbackTest, PeriodOutsideTaLibRangeThrows) {
    EXPECT_THROW(indicators::SmaIndicator(100001), core::IndicatorCalculationException);
    EXPECT_THROW(indicators::StdDevIndicator(100001), core::IndicatorCalculationException);
    EXPECT_THROW(indicators::AdxIndicator(100001), core::IndicatorCalculationException);
}
