#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "stratlab/strategy/rule_evaluator.hpp"

using namespace stratlab;
using namespace stratlab::testing;

class RuleEvaluatorTest : public TestBase {
protected:
    IndicatorContext prepared(const std::vector<Bar>& bars, const std::vector<IndicatorRef>& refs) {
        IndicatorContext context(bars);
        auto result = context.prepare(refs);
        EXPECT_TRUE(result.is_ok());
        return context;
    }
};

TEST_F(RuleEvaluatorTest, ThresholdComparisons) {
    auto bars = make_bars({5.0, 15.0});
    auto context = prepared(bars, {IndicatorRef::price()});

    Rule above{IndicatorRef::price(), Condition::GREATER_THAN, 10.0};
    Rule below{IndicatorRef::price(), Condition::LESS_THAN, 10.0};

    EXPECT_FALSE(RuleEvaluator::is_satisfied(above, 0, context));
    EXPECT_TRUE(RuleEvaluator::is_satisfied(above, 1, context));
    EXPECT_TRUE(RuleEvaluator::is_satisfied(below, 0, context));
    EXPECT_FALSE(RuleEvaluator::is_satisfied(below, 1, context));
}

TEST_F(RuleEvaluatorTest, CrossAboveRequiresStrictMove) {
    auto bars = make_bars({9.0, 10.0, 11.0, 10.0, 12.0});
    auto context = prepared(bars, {IndicatorRef::price()});
    Rule rule{IndicatorRef::price(), Condition::CROSSES_ABOVE, 10.0};

    EXPECT_FALSE(RuleEvaluator::evaluate(rule, 0, context).has_value());
    // Touching the level is not a cross
    EXPECT_FALSE(RuleEvaluator::is_satisfied(rule, 1, context));
    EXPECT_TRUE(RuleEvaluator::is_satisfied(rule, 2, context));
    EXPECT_FALSE(RuleEvaluator::is_satisfied(rule, 3, context));
    EXPECT_TRUE(RuleEvaluator::is_satisfied(rule, 4, context));
}

TEST_F(RuleEvaluatorTest, CrossBelowBetweenIndicators) {
    auto bars = make_bars({10.0, 10.0, 10.0, 13.0, 8.0});
    auto context = prepared(bars, {IndicatorRef::price(), IndicatorRef::sma(3)});
    Rule rule{IndicatorRef::price(), Condition::CROSSES_BELOW, IndicatorRef::sma(3)};

    // sma_3 is unavailable at index 1, so no cross can be judged at index 2
    EXPECT_FALSE(RuleEvaluator::evaluate(rule, 2, context).has_value());
    EXPECT_FALSE(RuleEvaluator::is_satisfied(rule, 3, context));
    // 13 > 11 then 8 < 10.333
    EXPECT_TRUE(RuleEvaluator::is_satisfied(rule, 4, context));
}

TEST_F(RuleEvaluatorTest, UnavailableValuesNeverSatisfy) {
    auto bars = make_bars(linear_closes(5, 100.0, 1.0));
    auto context = prepared(bars, {IndicatorRef::rsi(14)});
    Rule rule{IndicatorRef::rsi(14), Condition::LESS_THAN, 1000.0};

    for (size_t i = 0; i < bars.size(); ++i) {
        EXPECT_FALSE(RuleEvaluator::evaluate(rule, i, context).has_value());
        EXPECT_FALSE(RuleEvaluator::is_satisfied(rule, i, context));
    }
}

TEST_F(RuleEvaluatorTest, EqualsUsesRelativeTolerance) {
    EXPECT_TRUE(RuleEvaluator::approximately_equal(50.0, 50.0 + 1e-11));
    EXPECT_TRUE(RuleEvaluator::approximately_equal(1e6, 1e6 + 1e-4));
    EXPECT_FALSE(RuleEvaluator::approximately_equal(1e6, 1e6 + 1e-2));
    EXPECT_FALSE(RuleEvaluator::approximately_equal(0.0, 1e-6));

    auto bars = make_bars({0.1 + 0.2});
    auto context = prepared(bars, {IndicatorRef::price()});
    Rule rule{IndicatorRef::price(), Condition::EQUALS, 0.3};
    EXPECT_TRUE(RuleEvaluator::is_satisfied(rule, 0, context));
}

TEST_F(RuleEvaluatorTest, RuleDescription) {
    Rule rule{IndicatorRef::rsi(14), Condition::LESS_THAN, 30.0};
    EXPECT_NE(rule.to_string().find("rsi_14"), std::string::npos);
    EXPECT_EQ(condition_from_string("crosses_above"), Condition::CROSSES_ABOVE);
    EXPECT_EQ(condition_to_string(Condition::EQUALS), "equals");
    EXPECT_FALSE(condition_from_string("between").has_value());
}
