// include/stratlab/strategy/rule_evaluator.hpp
#pragma once

#include <optional>
#include "stratlab/indicators/indicator_context.hpp"
#include "stratlab/strategy/rule.hpp"

namespace stratlab {

/**
 * @brief Evaluates a single rule at a bar against prepared indicator series
 */
class RuleEvaluator {
public:
    // Relative tolerance for EQUALS, scaled by max(1, |lhs|, |rhs|)
    static constexpr double EQUALS_TOLERANCE = 1e-9;

    /**
     * @brief Evaluate a rule at a bar
     * @param rule Rule to evaluate
     * @param index Bar index
     * @param context Series prepared for this run
     * @return std::nullopt when an operand is unavailable at index (or index - 1 for crosses)
     */
    static std::optional<bool> evaluate(const Rule& rule, size_t index,
                                        const IndicatorContext& context);

    /**
     * @brief Evaluate with unavailable treated as false
     */
    static bool is_satisfied(const Rule& rule, size_t index, const IndicatorContext& context) {
        return evaluate(rule, index, context).value_or(false);
    }

    static bool approximately_equal(double lhs, double rhs);

private:
    static std::optional<double> operand_value(const RuleOperand& operand, size_t index,
                                               const IndicatorContext& context);
};

}  // namespace stratlab
