// include/stratlab/strategy/strategy_predicate.hpp
#pragma once

#include <vector>
#include "stratlab/indicators/indicator_context.hpp"
#include "stratlab/strategy/rule.hpp"
#include "stratlab/strategy/strategy_definition.hpp"

namespace stratlab {

/**
 * @brief Entry and exit decisions for one run
 *
 * Holds references to the definition and the run's indicator context, both
 * of which must outlive the predicate.
 */
class StrategyPredicate {
public:
    StrategyPredicate(const StrategyDefinition& definition, const IndicatorContext& context);

    /**
     * @brief All entry rules hold at index
     */
    bool should_enter(size_t index) const;

    /**
     * @brief All exit rules hold at index; always false with no exit rules
     */
    bool should_exit(size_t index) const;

    static bool all_satisfied(const std::vector<Rule>& rules, size_t index,
                              const IndicatorContext& context);

private:
    const StrategyDefinition& definition_;
    const IndicatorContext& context_;
};

}  // namespace stratlab
