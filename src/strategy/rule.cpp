// src/strategy/rule.cpp

#include "stratlab/strategy/rule.hpp"
#include <sstream>

namespace stratlab {

std::string condition_to_string(Condition condition) {
    switch (condition) {
        case Condition::GREATER_THAN:
            return "greater_than";
        case Condition::LESS_THAN:
            return "less_than";
        case Condition::CROSSES_ABOVE:
            return "crosses_above";
        case Condition::CROSSES_BELOW:
            return "crosses_below";
        case Condition::EQUALS:
            return "equals";
        default:
            return "unknown";
    }
}

std::optional<Condition> condition_from_string(const std::string& value) {
    if (value == "greater_than")
        return Condition::GREATER_THAN;
    if (value == "less_than")
        return Condition::LESS_THAN;
    if (value == "crosses_above")
        return Condition::CROSSES_ABOVE;
    if (value == "crosses_below")
        return Condition::CROSSES_BELOW;
    if (value == "equals")
        return Condition::EQUALS;
    return std::nullopt;
}

std::string Rule::to_string() const {
    std::ostringstream ss;
    ss << indicator.series_key() << " " << condition_to_string(condition) << " ";
    if (const auto* other = std::get_if<IndicatorRef>(&compare_to)) {
        ss << other->series_key();
    } else {
        ss << std::get<double>(compare_to);
    }
    return ss.str();
}

}  // namespace stratlab
