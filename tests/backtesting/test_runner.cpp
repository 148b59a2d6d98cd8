#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "stratlab/backtest/backtest_engine.hpp"
#include "stratlab/backtest/backtest_runner.hpp"

using namespace stratlab;
using namespace stratlab::backtest;
using namespace stratlab::testing;

class BacktestRunnerTest : public TestBase {
protected:
    BacktestRequest request(const std::string& symbol, size_t bars, double step) {
        BacktestRequest req;
        req.symbol = symbol;
        req.strategy.name = "momentum";
        req.strategy.entry_rules = {Rule{IndicatorRef::price(), Condition::GREATER_THAN,
                                         IndicatorRef::ema(5)}};
        req.strategy.exit_rules = {Rule{IndicatorRef::price(), Condition::LESS_THAN,
                                        IndicatorRef::ema(5)}};
        req.bars = make_bars(linear_closes(bars, 100.0, step), symbol);
        return req;
    }

    BacktestConfig config_;
};

TEST_F(BacktestRunnerTest, OutcomesFollowRequestOrder) {
    std::vector<BacktestRequest> requests = {request("AAA", 60, 1.0), request("BBB", 60, -0.5),
                                             request("CCC", 80, 0.25)};

    BacktestRunner runner(config_);
    auto outcomes = runner.run_all(requests, std::chrono::seconds(30));

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(outcomes[0].symbol, "AAA");
    EXPECT_EQ(outcomes[1].symbol, "BBB");
    EXPECT_EQ(outcomes[2].symbol, "CCC");
    for (auto& outcome : outcomes) {
        ASSERT_TRUE(outcome.result.is_ok()) << outcome.result.error()->to_string();
        EXPECT_EQ(outcome.result.value().symbol, outcome.symbol);
        EXPECT_EQ(outcome.strategy_name, "momentum");
    }
}

TEST_F(BacktestRunnerTest, ConcurrentRunsMatchSequentialRuns) {
    std::vector<BacktestRequest> requests;
    for (int i = 0; i < 6; ++i) {
        requests.push_back(request("SYM" + std::to_string(i), 100, 0.5 * (i - 3)));
    }

    BacktestRunner runner(config_);
    auto outcomes = runner.run_all(requests, std::chrono::seconds(30));
    ASSERT_EQ(outcomes.size(), requests.size());

    BacktestEngine engine(config_);
    for (size_t i = 0; i < requests.size(); ++i) {
        auto sequential = engine.run(requests[i]);
        ASSERT_TRUE(sequential.is_ok());
        ASSERT_TRUE(outcomes[i].result.is_ok());
        EXPECT_EQ(outcomes[i].result.value().to_json().dump(),
                  sequential.value().to_json().dump());
    }
}

TEST_F(BacktestRunnerTest, FailuresStayIsolated) {
    auto bad = request("BAD", 3, 1.0);
    bad.strategy.entry_rules[0].compare_to = IndicatorRef::ema(50);

    std::vector<BacktestRequest> requests = {request("GOOD", 60, 1.0), bad};
    auto outcomes = BacktestRunner(config_).run_all(requests, std::chrono::seconds(30));

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_TRUE(outcomes[0].result.is_ok());
    ASSERT_TRUE(outcomes[1].result.is_error());
    EXPECT_EQ(outcomes[1].result.error()->code(), ErrorCode::INSUFFICIENT_DATA);
}

TEST_F(BacktestRunnerTest, MissedDeadlineReportsTimeout) {
    {
        BacktestRunner runner(config_);
        auto result = runner.run_one(request("SLOW", 20000, 0.001), std::chrono::milliseconds(0));

        ASSERT_TRUE(result.is_error());
        EXPECT_EQ(result.error()->code(), ErrorCode::TIMEOUT_ERROR);
        EXPECT_EQ(runner.abandoned_workers(), 1u);
    }
    // The abandoned worker has been joined by the runner's destructor

    BacktestRunner runner(config_);
    auto outcomes = runner.run_all({request("QUICK", 60, 1.0)}, std::chrono::seconds(30));
    ASSERT_TRUE(outcomes[0].result.is_ok());
    EXPECT_EQ(runner.abandoned_workers(), 0u);
}

TEST_F(BacktestRunnerTest, SingleRunWithinDeadline) {
    auto result = BacktestRunner(config_).run_one(request("ONE", 50, 1.0),
                                                  std::chrono::seconds(30));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().symbol, "ONE");
}
