#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <numeric>
#include "../core/test_base.hpp"
#include "stratlab/backtest/backtest_engine.hpp"

using namespace stratlab;
using namespace stratlab::backtest;
using namespace stratlab::testing;

class BacktestEngineTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        config_.initial_capital = 10000.0;
        config_.commission_rate = 0.001;

        request_.symbol = "AAPL";
        request_.timeframe = DataFrequency::DAILY;
        request_.strategy.name = "SMA Crossover";
        request_.strategy.entry_rules = {
            Rule{IndicatorRef::sma(3), Condition::CROSSES_ABOVE, IndicatorRef::sma(8)}};
        request_.strategy.exit_rules = {
            Rule{IndicatorRef::sma(3), Condition::CROSSES_BELOW, IndicatorRef::sma(8)}};
        request_.bars = make_bars(oscillating_closes(120));
    }

    static std::vector<double> oscillating_closes(size_t count) {
        std::vector<double> closes;
        for (size_t i = 0; i < count; ++i) {
            closes.push_back(100.0 + 10.0 * std::sin(static_cast<double>(i) / 6.0) +
                             0.05 * static_cast<double>(i));
        }
        return closes;
    }

    BacktestConfig config_;
    BacktestRequest request_;
};

TEST_F(BacktestEngineTest, ProducesCompleteResult) {
    BacktestEngine engine(config_);
    auto result = engine.run(request_);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();

    const auto& r = result.value();
    EXPECT_EQ(r.symbol, "AAPL");
    EXPECT_EQ(r.strategy_name, "SMA Crossover");
    EXPECT_EQ(r.start_date, request_.bars.front().timestamp);
    EXPECT_EQ(r.end_date, request_.bars.back().timestamp);
    EXPECT_EQ(r.equity_curve.size(), request_.bars.size());
    EXPECT_GT(r.total_trades, 0);
    EXPECT_DOUBLE_EQ(r.initial_capital, 10000.0);
    EXPECT_GT(r.total_commission, 0.0);

    double pnl = std::accumulate(r.trades.begin(), r.trades.end(), 0.0,
                                 [](double acc, const Trade& t) { return acc + t.pnl; });
    EXPECT_NEAR(r.final_value, r.initial_capital + pnl, 1e-6);
    EXPECT_NEAR(r.total_return, r.final_value - r.initial_capital, 1e-9);

    // No trade enters before every indicator is available
    for (const auto& trade : r.trades) {
        EXPECT_GE(trade.entry_bar, 8u);
    }
}

TEST_F(BacktestEngineTest, RunsAreDeterministic) {
    BacktestEngine engine(config_);
    auto first = engine.run(request_);
    auto second = engine.run(request_);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    EXPECT_EQ(first.value().to_json().dump(), second.value().to_json().dump());
}

TEST_F(BacktestEngineTest, JsonUsesDatesAndNulls) {
    request_.strategy.entry_rules = {
        Rule{IndicatorRef::price(), Condition::LESS_THAN, 0.0}};
    request_.strategy.exit_rules.clear();

    auto result = BacktestEngine(config_).run(request_);
    ASSERT_TRUE(result.is_ok());

    auto j = result.value().to_json();
    EXPECT_EQ(j["start_date"], "2024-01-01");
    EXPECT_TRUE(j["sharpe_ratio"].is_null());
    EXPECT_TRUE(j["profit_factor"].is_null());
    EXPECT_EQ(j["total_trades"], 0);
    EXPECT_EQ(j["equity_curve"].size(), request_.bars.size());
}

TEST_F(BacktestEngineTest, RejectsInvalidConfigFirst) {
    config_.initial_capital = -1.0;
    request_.strategy.entry_rules.clear();
    request_.bars.clear();

    auto result = BacktestEngine(config_).run(request_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(BacktestEngineTest, RejectsInvalidStrategyBeforeData) {
    request_.strategy.position_size = 2.0;
    request_.bars.clear();

    auto result = BacktestEngine(config_).run(request_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_STRATEGY);
}

TEST_F(BacktestEngineTest, RejectsEmptyOrUnorderedBars) {
    BacktestEngine engine(config_);

    request_.bars.clear();
    auto empty = engine.run(request_);
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error()->code(), ErrorCode::INVALID_DATA);

    request_.bars = make_bars(oscillating_closes(20));
    std::swap(request_.bars[5], request_.bars[6]);
    auto unordered = engine.run(request_);
    ASSERT_TRUE(unordered.is_error());
    EXPECT_EQ(unordered.error()->code(), ErrorCode::INVALID_DATA);

    request_.bars = make_bars(oscillating_closes(20));
    request_.bars[7].timestamp = request_.bars[6].timestamp;
    EXPECT_TRUE(BacktestEngine::validate_bars(request_.bars).is_error());
}

TEST_F(BacktestEngineTest, RejectsNonFiniteBars) {
    BacktestEngine engine(config_);

    request_.bars[2].close = std::numeric_limits<double>::quiet_NaN();
    auto nan_close = engine.run(request_);
    ASSERT_TRUE(nan_close.is_error());
    EXPECT_EQ(nan_close.error()->code(), ErrorCode::INVALID_DATA);

    request_.bars = make_bars(oscillating_closes(120));
    request_.bars[50].high = std::numeric_limits<double>::infinity();
    EXPECT_TRUE(BacktestEngine::validate_bars(request_.bars).is_error());

    request_.bars = make_bars(oscillating_closes(120));
    request_.bars[0].volume = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(BacktestEngine::validate_bars(request_.bars).is_error());
}

TEST_F(BacktestEngineTest, RequiresMoreBarsThanWarmup) {
    BacktestEngine engine(config_);

    // sma_8 needs 7 bars of warm-up
    request_.bars = make_bars(oscillating_closes(7));
    auto short_run = engine.run(request_);
    ASSERT_TRUE(short_run.is_error());
    EXPECT_EQ(short_run.error()->code(), ErrorCode::INSUFFICIENT_DATA);

    request_.bars = make_bars(oscillating_closes(8));
    EXPECT_TRUE(engine.run(request_).is_ok());
}

TEST_F(BacktestEngineTest, BuyAndHoldIsForceClosedAtLastBar) {
    request_.strategy.name = "Buy and Hold";
    request_.strategy.entry_rules = {Rule{IndicatorRef::price(), Condition::GREATER_THAN, 0.0}};
    request_.strategy.exit_rules.clear();
    request_.bars = make_bars(linear_closes(38, 30.0, 10.0));
    ASSERT_DOUBLE_EQ(request_.bars.back().close, 400.0);

    auto result = BacktestEngine(config_).run(request_);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const auto& r = result.value();

    ASSERT_EQ(r.trades.size(), 1u);
    EXPECT_EQ(r.total_trades, 1);
    EXPECT_TRUE(r.trades[0].incomplete);
    EXPECT_EQ(r.trades[0].exit_reason, ExitReason::END_OF_DATA);
    EXPECT_EQ(r.trades[0].entry_bar, 0u);
    EXPECT_EQ(r.trades[0].exit_bar, 37u);
    EXPECT_EQ(r.completed_trades, 0);
    EXPECT_DOUBLE_EQ(r.win_rate, 0.0);
    EXPECT_FALSE(r.profit_factor.has_value());

    // Entry commission comes out of the committed cash; the forced close is free
    EXPECT_NEAR(r.final_value, 10000.0 * 400.0 / (30.0 * 1.001), 1e-6);
    EXPECT_NEAR(r.total_commission, 10000.0 - 10000.0 / 1.001, 1e-9);
    EXPECT_NEAR(r.final_value, r.initial_capital + r.trades[0].pnl, 1e-6);
}

TEST_F(BacktestEngineTest, OversoldEntryNeverFiresOnRisingSeries) {
    request_.strategy.name = "RSI Oversold";
    request_.strategy.entry_rules = {Rule{IndicatorRef::rsi(14), Condition::LESS_THAN, 30.0}};
    request_.strategy.exit_rules = {Rule{IndicatorRef::rsi(14), Condition::GREATER_THAN, 70.0}};
    request_.bars = make_bars(linear_closes(60, 100.0, 1.0));

    auto result = BacktestEngine(config_).run(request_);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const auto& r = result.value();

    EXPECT_EQ(r.total_trades, 0);
    EXPECT_TRUE(r.trades.empty());
    EXPECT_DOUBLE_EQ(r.final_value, r.initial_capital);
    EXPECT_DOUBLE_EQ(r.total_return, 0.0);
    EXPECT_DOUBLE_EQ(r.max_drawdown, 0.0);
    EXPECT_FALSE(r.sharpe_ratio.has_value());
    ASSERT_EQ(r.equity_curve.size(), request_.bars.size());
    for (const auto& point : r.equity_curve) {
        EXPECT_DOUBLE_EQ(point.second, 10000.0);
    }
}

TEST_F(BacktestEngineTest, EntryOnSecondToLastBarClosesAtLastBar) {
    std::vector<double> closes(29, 100.0);
    closes.push_back(160.0);
    closes.push_back(170.0);
    request_.strategy.entry_rules = {Rule{IndicatorRef::price(), Condition::GREATER_THAN, 150.0}};
    request_.strategy.exit_rules = {Rule{IndicatorRef::price(), Condition::LESS_THAN, 50.0}};
    request_.bars = make_bars(closes);

    auto result = BacktestEngine(config_).run(request_);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const auto& r = result.value();

    ASSERT_EQ(r.trades.size(), 1u);
    const auto& trade = r.trades[0];
    EXPECT_EQ(trade.entry_bar, 29u);
    EXPECT_EQ(trade.entry_time, request_.bars[29].timestamp);
    EXPECT_EQ(trade.exit_time, request_.bars.back().timestamp);
    EXPECT_DOUBLE_EQ(trade.exit_price, 170.0);
    EXPECT_TRUE(trade.incomplete);
}

TEST_F(BacktestEngineTest, CashConservedWithCommissionAndForcedClose) {
    request_.strategy.entry_rules = {Rule{IndicatorRef::price(), Condition::GREATER_THAN, 105.0}};
    request_.strategy.exit_rules = {Rule{IndicatorRef::price(), Condition::LESS_THAN, 95.0}};
    request_.bars = make_bars({100.0, 110.0, 90.0, 110.0, 120.0});

    auto result = BacktestEngine(config_).run(request_);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const auto& r = result.value();

    ASSERT_EQ(r.trades.size(), 2u);
    EXPECT_FALSE(r.trades[0].incomplete);
    EXPECT_EQ(r.trades[0].exit_reason, ExitReason::SIGNAL);
    EXPECT_TRUE(r.trades[1].incomplete);
    EXPECT_EQ(r.completed_trades, 1);

    double pnl = 0.0;
    double commission = 0.0;
    for (const auto& trade : r.trades) {
        pnl += trade.pnl;
        commission += trade.commission;
    }
    EXPECT_GT(commission, 0.0);
    EXPECT_NEAR(r.total_commission, commission, 1e-9);
    EXPECT_NEAR(r.final_value, r.initial_capital + pnl, 1e-6);
    EXPECT_NEAR(r.equity_curve.back().second, r.final_value, 1e-6);
}
