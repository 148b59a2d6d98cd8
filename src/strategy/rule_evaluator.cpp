// src/strategy/rule_evaluator.cpp

#include "stratlab/strategy/rule_evaluator.hpp"
#include <algorithm>
#include <cmath>

namespace stratlab {

bool RuleEvaluator::approximately_equal(double lhs, double rhs) {
    double scale = std::max({1.0, std::abs(lhs), std::abs(rhs)});
    return std::abs(lhs - rhs) <= EQUALS_TOLERANCE * scale;
}

std::optional<double> RuleEvaluator::operand_value(const RuleOperand& operand, size_t index,
                                                   const IndicatorContext& context) {
    if (const auto* ref = std::get_if<IndicatorRef>(&operand)) {
        return context.value(*ref, index);
    }
    return std::get<double>(operand);
}

std::optional<bool> RuleEvaluator::evaluate(const Rule& rule, size_t index,
                                            const IndicatorContext& context) {
    auto lhs = context.value(rule.indicator, index);
    auto rhs = operand_value(rule.compare_to, index, context);
    if (!lhs || !rhs) {
        return std::nullopt;
    }

    switch (rule.condition) {
        case Condition::GREATER_THAN:
            return *lhs > *rhs;
        case Condition::LESS_THAN:
            return *lhs < *rhs;
        case Condition::EQUALS:
            return approximately_equal(*lhs, *rhs);
        case Condition::CROSSES_ABOVE:
        case Condition::CROSSES_BELOW: {
            if (index == 0) {
                return std::nullopt;
            }
            auto prev_lhs = context.value(rule.indicator, index - 1);
            auto prev_rhs = operand_value(rule.compare_to, index - 1, context);
            if (!prev_lhs || !prev_rhs) {
                return std::nullopt;
            }
            if (rule.condition == Condition::CROSSES_ABOVE) {
                return *prev_lhs <= *prev_rhs && *lhs > *rhs;
            }
            return *prev_lhs >= *prev_rhs && *lhs < *rhs;
        }
    }
    return std::nullopt;
}

}  // namespace stratlab
