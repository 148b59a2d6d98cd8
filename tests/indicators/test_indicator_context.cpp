#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "stratlab/indicators/indicator_context.hpp"

using namespace stratlab;
using namespace stratlab::testing;

class IndicatorContextTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        bars_ = make_bars(linear_closes(40, 100.0, 1.0));
    }

    std::vector<Bar> bars_;
};

TEST_F(IndicatorContextTest, SharedSeriesComputedOnce) {
    IndicatorContext context(bars_);
    auto prepared = context.prepare({IndicatorRef::sma(5), IndicatorRef::sma(5),
                                     IndicatorRef::sma(10), IndicatorRef::price()});

    ASSERT_TRUE(prepared.is_ok());
    EXPECT_EQ(context.series_count(), 3u);
    EXPECT_EQ(context.bar_count(), 40u);
    EXPECT_NE(context.all_series().find("sma_5"), context.all_series().end());
}

TEST_F(IndicatorContextTest, DistinctOutputsAreDistinctSeries) {
    IndicatorContext context(bars_);
    auto prepared = context.prepare(
        {IndicatorRef::macd(5, 10, 3), IndicatorRef::macd(5, 10, 3, IndicatorOutput::MACD_SIGNAL)});

    ASSERT_TRUE(prepared.is_ok());
    EXPECT_EQ(context.series_count(), 2u);
}

TEST_F(IndicatorContextTest, CloseBandWidthsAreDistinctSeries) {
    auto narrow = IndicatorRef::bollinger(20, 2.0, IndicatorOutput::BB_UPPER);
    auto wide = IndicatorRef::bollinger(20, 2.0000001, IndicatorOutput::BB_UPPER);
    EXPECT_EQ(narrow.series_key(), "bbu_20_2");
    EXPECT_EQ(wide.series_key(), "bbu_20_2.0000001");
    EXPECT_NE(IndicatorRef::bollinger(20, 1.2345678, IndicatorOutput::BB_LOWER).series_key(),
              IndicatorRef::bollinger(20, 1.2345679, IndicatorOutput::BB_LOWER).series_key());

    IndicatorContext context(bars_);
    ASSERT_TRUE(context.prepare({narrow, wide}).is_ok());
    EXPECT_EQ(context.series_count(), 2u);

    auto narrow_value = context.value(narrow, 30);
    auto wide_value = context.value(wide, 30);
    ASSERT_TRUE(narrow_value.has_value());
    ASSERT_TRUE(wide_value.has_value());
    EXPECT_LT(*narrow_value, *wide_value);
}

TEST_F(IndicatorContextTest, ValueLookup) {
    IndicatorContext context(bars_);
    ASSERT_TRUE(context.prepare({IndicatorRef::sma(3)}).is_ok());

    EXPECT_FALSE(context.value(IndicatorRef::sma(3), 1).has_value());
    EXPECT_DOUBLE_EQ(*context.value(IndicatorRef::sma(3), 2), 101.0);
    EXPECT_FALSE(context.value(IndicatorRef::sma(3), 400).has_value());
    EXPECT_FALSE(context.value(IndicatorRef::ema(3), 10).has_value());
    EXPECT_EQ(context.find(IndicatorRef::ema(3)), nullptr);
}

TEST_F(IndicatorContextTest, PrepareFailsOnInvalidReference) {
    IndicatorContext context(bars_);
    auto prepared = context.prepare({IndicatorRef::rsi(-1)});

    ASSERT_TRUE(prepared.is_error());
    EXPECT_EQ(prepared.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(context.series_count(), 0u);
}
