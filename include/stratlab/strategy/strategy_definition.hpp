// include/stratlab/strategy/strategy_definition.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "stratlab/core/error.hpp"
#include "stratlab/indicators/indicator_types.hpp"
#include "stratlab/strategy/rule.hpp"

namespace stratlab {

/**
 * @brief Declarative rule-based strategy
 *
 * Entry rules are AND-combined and must not be empty. Exit rules are
 * AND-combined; an empty list never signals an exit.
 */
struct StrategyDefinition {
    std::string name;
    std::string description;
    std::vector<Rule> entry_rules;
    std::vector<Rule> exit_rules;
    double position_size{1.0};  // Fraction of cash committed on entry, in (0, 1]
    int max_positions{1};       // Only one concurrent position is simulated
    std::optional<double> stop_loss;    // Fractional loss from entry, e.g. 0.05
    std::optional<double> take_profit;  // Fractional gain from entry

    /**
     * @brief Check the definition before any computation
     * @return INVALID_STRATEGY naming the offending field, e.g. entry_rules[1].params.period
     */
    Result<void> validate() const;

    /**
     * @brief Every indicator line read by any rule, operands included
     */
    std::vector<IndicatorRef> referenced_indicators() const;

    /**
     * @brief Largest warm-up across all referenced indicators
     *
     * A series must have more bars than this for any rule to become available.
     */
    int required_warmup() const;
};

}  // namespace stratlab
