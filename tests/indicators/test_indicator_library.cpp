#include <gtest/gtest.h>
#include <cmath>
#include "../core/test_base.hpp"
#include "stratlab/indicators/indicator_library.hpp"

using namespace stratlab;
using namespace stratlab::testing;

class IndicatorLibraryTest : public TestBase {};

TEST_F(IndicatorLibraryTest, SmaWarmupAndValues) {
    auto values = IndicatorLibrary::sma({1.0, 2.0, 3.0, 4.0, 5.0}, 3);

    ASSERT_EQ(values.size(), 5u);
    EXPECT_FALSE(values[0].has_value());
    EXPECT_FALSE(values[1].has_value());
    EXPECT_DOUBLE_EQ(*values[2], 2.0);
    EXPECT_DOUBLE_EQ(*values[3], 3.0);
    EXPECT_DOUBLE_EQ(*values[4], 4.0);
}

TEST_F(IndicatorLibraryTest, ShortInputIsUnavailableNotError) {
    auto values = IndicatorLibrary::sma({1.0, 2.0}, 5);
    ASSERT_EQ(values.size(), 2u);
    EXPECT_FALSE(values[0].has_value());
    EXPECT_FALSE(values[1].has_value());

    auto rsi = IndicatorLibrary::rsi({1.0, 2.0, 3.0}, 14);
    for (const auto& v : rsi) {
        EXPECT_FALSE(v.has_value());
    }
}

TEST_F(IndicatorLibraryTest, EmaSeededWithSma) {
    auto values = IndicatorLibrary::ema({1.0, 2.0, 3.0, 4.0, 5.0}, 3);

    EXPECT_FALSE(values[1].has_value());
    EXPECT_DOUBLE_EQ(*values[2], 2.0);
    // alpha = 0.5
    EXPECT_DOUBLE_EQ(*values[3], 3.0);
    EXPECT_DOUBLE_EQ(*values[4], 4.0);
}

TEST_F(IndicatorLibraryTest, RsiIsHundredWithoutLosses) {
    auto values = IndicatorLibrary::rsi(linear_closes(10, 100.0, 1.0), 3);

    EXPECT_FALSE(values[2].has_value());
    for (size_t i = 3; i < values.size(); ++i) {
        ASSERT_TRUE(values[i].has_value()) << "index " << i;
        EXPECT_DOUBLE_EQ(*values[i], 100.0);
    }
}

TEST_F(IndicatorLibraryTest, RsiWilderSmoothing) {
    auto values = IndicatorLibrary::rsi({10.0, 11.0, 10.0, 11.0, 10.0}, 2);

    EXPECT_FALSE(values[1].has_value());
    EXPECT_DOUBLE_EQ(*values[2], 50.0);
    // avg gain 0.75, avg loss 0.25
    EXPECT_DOUBLE_EQ(*values[3], 75.0);
}

TEST_F(IndicatorLibraryTest, MacdOnLinearTrend) {
    auto lines = IndicatorLibrary::macd(linear_closes(10, 50.0, 1.0), 2, 3, 2);

    EXPECT_FALSE(lines.line[1].has_value());
    ASSERT_TRUE(lines.line[2].has_value());
    EXPECT_NEAR(*lines.line[2], 0.5, 1e-12);
    EXPECT_NEAR(*lines.line[9], 0.5, 1e-12);

    EXPECT_FALSE(lines.signal[2].has_value());
    ASSERT_TRUE(lines.signal[3].has_value());
    EXPECT_NEAR(*lines.signal[3], 0.5, 1e-12);
    EXPECT_NEAR(*lines.histogram[5], 0.0, 1e-12);
}

TEST_F(IndicatorLibraryTest, MacdKeysAndWarmup) {
    auto line = IndicatorRef::macd(12, 26, 9);
    auto signal = IndicatorRef::macd(12, 26, 9, IndicatorOutput::MACD_SIGNAL);
    auto hist = IndicatorRef::macd(12, 26, 9, IndicatorOutput::MACD_HISTOGRAM);

    EXPECT_EQ(line.series_key(), "macd_12_26_9");
    EXPECT_EQ(signal.series_key(), "macds_12_26_9");
    EXPECT_EQ(hist.series_key(), "macdh_12_26_9");
    EXPECT_EQ(line.warmup_bars(), 25);
    EXPECT_EQ(signal.warmup_bars(), 33);
    EXPECT_EQ(hist.warmup_bars(), 33);

    auto bars = make_bars(linear_closes(60, 100.0, 0.5));
    auto computed = IndicatorLibrary::compute(signal, bars);
    ASSERT_TRUE(computed.is_ok());
    const auto& series = computed.value();
    EXPECT_EQ(series.name, "macds_12_26_9");
    EXPECT_FALSE(series.available(32));
    EXPECT_TRUE(series.available(33));
}

TEST_F(IndicatorLibraryTest, BollingerUsesPopulationStdDev) {
    auto bands = IndicatorLibrary::bollinger({1.0, 2.0, 3.0}, 3, 2.0);

    EXPECT_FALSE(bands.upper[1].has_value());
    const double stddev = std::sqrt(2.0 / 3.0);
    EXPECT_DOUBLE_EQ(*bands.middle[2], 2.0);
    EXPECT_DOUBLE_EQ(*bands.upper[2], 2.0 + 2.0 * stddev);
    EXPECT_DOUBLE_EQ(*bands.lower[2], 2.0 - 2.0 * stddev);
}

TEST_F(IndicatorLibraryTest, BollingerKeys) {
    EXPECT_EQ(IndicatorRef::bollinger(20, 2.0, IndicatorOutput::BB_UPPER).series_key(),
              "bbu_20_2");
    EXPECT_EQ(IndicatorRef::bollinger(20, 2.5, IndicatorOutput::BB_LOWER).series_key(),
              "bbl_20_2.5");
    EXPECT_EQ(IndicatorRef::bollinger(20, 2.0).series_key(), "bbm_20_2");
}

TEST_F(IndicatorLibraryTest, AtrStartsAtPeriod) {
    // high - low is always 2 and closes never move
    auto bars = make_bars(std::vector<double>(6, 10.0));
    auto values = IndicatorLibrary::atr(bars, 2);

    EXPECT_FALSE(values[0].has_value());
    EXPECT_FALSE(values[1].has_value());
    EXPECT_DOUBLE_EQ(*values[2], 2.0);
    EXPECT_DOUBLE_EQ(*values[5], 2.0);
    EXPECT_EQ(IndicatorRef::atr(2).warmup_bars(), 2);
}

TEST_F(IndicatorLibraryTest, TrueRangeUsesPreviousClose) {
    auto bars = make_ohlc_bars({11.0, 20.0}, {9.0, 18.0}, {10.0, 19.0});
    auto tr = IndicatorLibrary::true_range(bars);

    EXPECT_FALSE(tr[0].has_value());
    EXPECT_DOUBLE_EQ(*tr[1], 10.0);
}

TEST_F(IndicatorLibraryTest, StochasticOnRisingCloses) {
    auto bars = make_bars(linear_closes(6, 10.0, 1.0));
    auto lines = IndicatorLibrary::stochastic(bars, 3, 2);

    EXPECT_FALSE(lines.k[1].has_value());
    ASSERT_TRUE(lines.k[2].has_value());
    EXPECT_DOUBLE_EQ(*lines.k[2], 75.0);
    EXPECT_FALSE(lines.d[2].has_value());
    ASSERT_TRUE(lines.d[3].has_value());
    EXPECT_DOUBLE_EQ(*lines.d[3], 75.0);
}

TEST_F(IndicatorLibraryTest, StochasticFlatRangeIsUnavailable) {
    std::vector<double> flat(8, 5.0);
    auto bars = make_ohlc_bars(flat, flat, flat);
    auto lines = IndicatorLibrary::stochastic(bars, 3, 2);

    for (size_t i = 0; i < bars.size(); ++i) {
        EXPECT_FALSE(lines.k[i].has_value()) << "index " << i;
        EXPECT_FALSE(lines.d[i].has_value()) << "index " << i;
    }
}

TEST_F(IndicatorLibraryTest, PriceFieldSelection) {
    auto bars = make_bars({10.0, 12.0});
    auto high = IndicatorLibrary::compute(IndicatorRef::price(PriceField::HIGH), bars);
    ASSERT_TRUE(high.is_ok());
    EXPECT_EQ(high.value().name, "high");
    EXPECT_DOUBLE_EQ(*high.value().at(1), 13.0);
    EXPECT_EQ(IndicatorRef::price().warmup_bars(), 0);
}

TEST_F(IndicatorLibraryTest, InvalidPeriodRejected) {
    auto bars = make_bars(linear_closes(30, 100.0, 1.0));
    auto result = IndicatorLibrary::compute(IndicatorRef::sma(0), bars);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(std::string(result.error()->what()).rfind("period", 0), 0u);
}

TEST_F(IndicatorLibraryTest, OversizedPeriodRejected) {
    EXPECT_TRUE(IndicatorRef::sma(MAX_INDICATOR_PERIOD + 1).validate().is_error());

    auto largest = IndicatorRef::macd(MAX_INDICATOR_PERIOD, MAX_INDICATOR_PERIOD,
                                      MAX_INDICATOR_PERIOD, IndicatorOutput::MACD_SIGNAL);
    EXPECT_TRUE(largest.validate().is_ok());
    EXPECT_EQ(largest.warmup_bars(), 2 * MAX_INDICATOR_PERIOD - 2);

    auto too_slow = IndicatorRef::macd(12, MAX_INDICATOR_PERIOD + 1, 9);
    auto result = too_slow.validate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(std::string(result.error()->what()).rfind("slow", 0), 0u);
}

TEST_F(IndicatorLibraryTest, MismatchedOutputRejected) {
    IndicatorRef ref = IndicatorRef::rsi(14);
    ref.output = IndicatorOutput::BB_UPPER;

    EXPECT_FALSE(ref.output_valid());
    EXPECT_TRUE(ref.validate().is_error());
}

TEST_F(IndicatorLibraryTest, OutputNamesParse) {
    EXPECT_EQ(indicator_output_from_string(IndicatorKind::MACD, "signal"),
              IndicatorOutput::MACD_SIGNAL);
    EXPECT_EQ(indicator_output_from_string(IndicatorKind::STOCHASTIC, "%d"),
              IndicatorOutput::STOCH_D);
    EXPECT_EQ(indicator_output_from_string(IndicatorKind::BBANDS, "value"),
              IndicatorOutput::BB_MIDDLE);
    EXPECT_EQ(indicator_kind_from_string("bollinger"), IndicatorKind::BBANDS);
    EXPECT_FALSE(indicator_kind_from_string("vwap").has_value());
}
