// src/strategy/strategy_definition.cpp

#include "stratlab/strategy/strategy_definition.hpp"
#include <algorithm>
#include <cmath>
#include "stratlab/core/logger.hpp"

namespace stratlab {

namespace {

Result<void> invalid(const std::string& message) {
    return make_error<void>(ErrorCode::INVALID_STRATEGY, message, "StrategyDefinition");
}

Result<void> validate_ref(const IndicatorRef& ref, const std::string& path) {
    if (!ref.output_valid()) {
        return invalid(path + ".output: '" + indicator_output_to_string(ref.output) +
                       "' is not produced by '" + indicator_kind_to_string(ref.kind()) + "'");
    }
    auto valid = ref.validate();
    if (valid.is_error()) {
        // Parameter messages start with the parameter name
        return invalid(path + ".params." + valid.error()->what());
    }
    return Result<void>();
}

Result<void> validate_rules(const std::vector<Rule>& rules, const std::string& list_name) {
    for (size_t i = 0; i < rules.size(); ++i) {
        const std::string path = list_name + "[" + std::to_string(i) + "]";
        const Rule& rule = rules[i];

        auto left = validate_ref(rule.indicator, path);
        if (left.is_error()) {
            return left;
        }

        if (const auto* other = std::get_if<IndicatorRef>(&rule.compare_to)) {
            auto right = validate_ref(*other, path + ".compare_to");
            if (right.is_error()) {
                return right;
            }
        } else if (!std::isfinite(std::get<double>(rule.compare_to))) {
            return invalid(path + ".compare_to must be a finite number");
        }
    }
    return Result<void>();
}

Result<void> validate_fraction(const std::optional<double>& value, const std::string& name) {
    if (value && (!std::isfinite(*value) || *value <= 0.0)) {
        return invalid(name + " must be a positive fraction, got " + std::to_string(*value));
    }
    return Result<void>();
}

}  // namespace

Result<void> StrategyDefinition::validate() const {
    if (entry_rules.empty()) {
        return invalid("entry_rules must contain at least one rule");
    }

    auto entry = validate_rules(entry_rules, "entry_rules");
    if (entry.is_error()) {
        return entry;
    }
    auto exit = validate_rules(exit_rules, "exit_rules");
    if (exit.is_error()) {
        return exit;
    }

    if (!std::isfinite(position_size) || position_size <= 0.0 || position_size > 1.0) {
        return invalid("position_size must be in (0, 1], got " + std::to_string(position_size));
    }

    if (max_positions < 1) {
        return invalid("max_positions must be at least 1, got " + std::to_string(max_positions));
    }
    if (max_positions > 1) {
        WARN("Strategy '" << name << "' requests max_positions=" << max_positions
                          << "; only one concurrent position is simulated");
    }

    auto sl = validate_fraction(stop_loss, "stop_loss");
    if (sl.is_error()) {
        return sl;
    }
    if (stop_loss && *stop_loss >= 1.0) {
        return invalid("stop_loss must be below 1, got " + std::to_string(*stop_loss));
    }
    return validate_fraction(take_profit, "take_profit");
}

std::vector<IndicatorRef> StrategyDefinition::referenced_indicators() const {
    std::vector<IndicatorRef> refs;
    auto collect = [&refs](const std::vector<Rule>& rules) {
        for (const auto& rule : rules) {
            refs.push_back(rule.indicator);
            if (const auto* other = std::get_if<IndicatorRef>(&rule.compare_to)) {
                refs.push_back(*other);
            }
        }
    };
    collect(entry_rules);
    collect(exit_rules);
    return refs;
}

int StrategyDefinition::required_warmup() const {
    int warmup = 0;
    for (const auto& ref : referenced_indicators()) {
        warmup = std::max(warmup, ref.warmup_bars());
    }
    return warmup;
}

}  // namespace stratlab
