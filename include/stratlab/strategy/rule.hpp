// include/stratlab/strategy/rule.hpp
#pragma once

#include <optional>
#include <string>
#include <variant>
#include "stratlab/indicators/indicator_types.hpp"

namespace stratlab {

/**
 * @brief Comparison applied between a rule's indicator and its operand
 */
enum class Condition { GREATER_THAN, LESS_THAN, CROSSES_ABOVE, CROSSES_BELOW, EQUALS };

/**
 * @brief Right-hand side of a rule: a constant or another indicator line
 */
using RuleOperand = std::variant<double, IndicatorRef>;

/**
 * @brief One condition over indicator values at a bar
 */
struct Rule {
    IndicatorRef indicator;
    Condition condition{Condition::GREATER_THAN};
    RuleOperand compare_to{0.0};

    bool compares_to_indicator() const {
        return std::holds_alternative<IndicatorRef>(compare_to);
    }

    std::string to_string() const;
};

std::string condition_to_string(Condition condition);
std::optional<Condition> condition_from_string(const std::string& value);

}  // namespace stratlab
