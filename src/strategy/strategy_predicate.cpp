// src/strategy/strategy_predicate.cpp

#include "stratlab/strategy/strategy_predicate.hpp"
#include "stratlab/strategy/rule_evaluator.hpp"

namespace stratlab {

StrategyPredicate::StrategyPredicate(const StrategyDefinition& definition,
                                     const IndicatorContext& context)
    : definition_(definition), context_(context) {}

bool StrategyPredicate::all_satisfied(const std::vector<Rule>& rules, size_t index,
                                      const IndicatorContext& context) {
    for (const auto& rule : rules) {
        if (!RuleEvaluator::is_satisfied(rule, index, context)) {
            return false;
        }
    }
    return true;
}

bool StrategyPredicate::should_enter(size_t index) const {
    if (definition_.entry_rules.empty()) {
        return false;
    }
    return all_satisfied(definition_.entry_rules, index, context_);
}

bool StrategyPredicate::should_exit(size_t index) const {
    if (definition_.exit_rules.empty()) {
        return false;
    }
    return all_satisfied(definition_.exit_rules, index, context_);
}

}  // namespace stratlab
