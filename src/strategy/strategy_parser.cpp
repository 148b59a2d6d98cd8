// src/strategy/strategy_parser.cpp

#include "stratlab/strategy/strategy_parser.hpp"
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace stratlab {

namespace {

const std::string COMPONENT = "StrategyParser";

template <typename T>
Result<T> invalid(const std::string& message) {
    return make_error<T>(ErrorCode::INVALID_STRATEGY, message, COMPONENT);
}

Result<int> read_int(const nlohmann::json& params, const std::string& key, int fallback,
                     const std::string& path) {
    if (!params.contains(key) || params.at(key).is_null()) {
        return Result<int>(fallback);
    }
    const auto& value = params.at(key);
    constexpr auto lowest = std::numeric_limits<int>::min();
    constexpr auto highest = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        auto u = value.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(highest)) {
            return Result<int>(static_cast<int>(u));
        }
    } else if (value.is_number_integer()) {
        auto i = value.get<std::int64_t>();
        if (i >= lowest && i <= highest) {
            return Result<int>(static_cast<int>(i));
        }
    } else if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::isfinite(d) && d == std::floor(d)) {
            if (d >= static_cast<double>(lowest) && d <= static_cast<double>(highest)) {
                return Result<int>(static_cast<int>(d));
            }
        } else {
            return invalid<int>(path + "." + key + " must be an integer, got " + value.dump());
        }
    } else {
        return invalid<int>(path + "." + key + " must be an integer, got " + value.dump());
    }
    return invalid<int>(path + "." + key + " is out of range, got " + value.dump());
}

Result<double> read_double(const nlohmann::json& params, const std::string& key, double fallback,
                           const std::string& path) {
    if (!params.contains(key) || params.at(key).is_null()) {
        return Result<double>(fallback);
    }
    const auto& value = params.at(key);
    if (!value.is_number()) {
        return invalid<double>(path + "." + key + " must be a number, got " + value.dump());
    }
    return Result<double>(value.get<double>());
}

// First key present among the aliases, or the primary key
std::string resolve_alias(const nlohmann::json& params, const std::string& primary,
                          const std::string& alias) {
    if (!params.contains(primary) && params.contains(alias)) {
        return alias;
    }
    return primary;
}

Result<IndicatorParams> params_from_json(IndicatorKind kind, const nlohmann::json& params,
                                         const std::string& path) {
    switch (kind) {
        case IndicatorKind::PRICE: {
            PriceParams p;
            if (params.contains("field")) {
                const auto& value = params.at("field");
                std::optional<PriceField> field;
                if (value.is_string()) {
                    field = price_field_from_string(value.get<std::string>());
                }
                if (!field) {
                    return invalid<IndicatorParams>(path + ".field must be one of open, high, "
                                                           "low, close, volume, got " +
                                                    value.dump());
                }
                p.field = *field;
            }
            return Result<IndicatorParams>(IndicatorParams(p));
        }
        case IndicatorKind::SMA:
        case IndicatorKind::EMA:
        case IndicatorKind::RSI:
        case IndicatorKind::ATR: {
            int fallback = (kind == IndicatorKind::RSI || kind == IndicatorKind::ATR) ? 14 : 20;
            auto period = read_int(params, "period", fallback, path);
            if (period.is_error()) {
                return forward_error<IndicatorParams>(*period.error());
            }
            if (kind == IndicatorKind::SMA)
                return Result<IndicatorParams>(IndicatorParams(SmaParams{period.value()}));
            if (kind == IndicatorKind::EMA)
                return Result<IndicatorParams>(IndicatorParams(EmaParams{period.value()}));
            if (kind == IndicatorKind::RSI)
                return Result<IndicatorParams>(IndicatorParams(RsiParams{period.value()}));
            return Result<IndicatorParams>(IndicatorParams(AtrParams{period.value()}));
        }
        case IndicatorKind::MACD: {
            MacdParams p;
            auto fast = read_int(params, "fast", p.fast, path);
            if (fast.is_error())
                return forward_error<IndicatorParams>(*fast.error());
            auto slow = read_int(params, "slow", p.slow, path);
            if (slow.is_error())
                return forward_error<IndicatorParams>(*slow.error());
            auto signal = read_int(params, "signal", p.signal, path);
            if (signal.is_error())
                return forward_error<IndicatorParams>(*signal.error());
            p.fast = fast.value();
            p.slow = slow.value();
            p.signal = signal.value();
            return Result<IndicatorParams>(IndicatorParams(p));
        }
        case IndicatorKind::BBANDS: {
            BollingerParams p;
            auto period = read_int(params, "period", p.period, path);
            if (period.is_error())
                return forward_error<IndicatorParams>(*period.error());
            auto num_std =
                read_double(params, resolve_alias(params, "num_std", "std_dev"), p.num_std, path);
            if (num_std.is_error())
                return forward_error<IndicatorParams>(*num_std.error());
            p.period = period.value();
            p.num_std = num_std.value();
            return Result<IndicatorParams>(IndicatorParams(p));
        }
        case IndicatorKind::STOCHASTIC: {
            StochasticParams p;
            auto period = read_int(params, "period", p.period, path);
            if (period.is_error())
                return forward_error<IndicatorParams>(*period.error());
            auto smooth =
                read_int(params, resolve_alias(params, "smooth", "smooth_d"), p.smooth, path);
            if (smooth.is_error())
                return forward_error<IndicatorParams>(*smooth.error());
            p.period = period.value();
            p.smooth = smooth.value();
            return Result<IndicatorParams>(IndicatorParams(p));
        }
    }
    return invalid<IndicatorParams>(path + " has an unsupported indicator kind");
}

nlohmann::json params_to_json(const IndicatorRef& ref) {
    nlohmann::json params = nlohmann::json::object();
    switch (ref.kind()) {
        case IndicatorKind::PRICE:
            params["field"] = price_field_to_string(std::get<PriceParams>(ref.params).field);
            break;
        case IndicatorKind::SMA:
            params["period"] = std::get<SmaParams>(ref.params).period;
            break;
        case IndicatorKind::EMA:
            params["period"] = std::get<EmaParams>(ref.params).period;
            break;
        case IndicatorKind::RSI:
            params["period"] = std::get<RsiParams>(ref.params).period;
            break;
        case IndicatorKind::MACD: {
            const auto& p = std::get<MacdParams>(ref.params);
            params["fast"] = p.fast;
            params["slow"] = p.slow;
            params["signal"] = p.signal;
            break;
        }
        case IndicatorKind::BBANDS: {
            const auto& p = std::get<BollingerParams>(ref.params);
            params["period"] = p.period;
            params["num_std"] = p.num_std;
            break;
        }
        case IndicatorKind::ATR:
            params["period"] = std::get<AtrParams>(ref.params).period;
            break;
        case IndicatorKind::STOCHASTIC: {
            const auto& p = std::get<StochasticParams>(ref.params);
            params["period"] = p.period;
            params["smooth"] = p.smooth;
            break;
        }
    }
    return params;
}

Result<Rule> rule_from_json(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) {
        return invalid<Rule>(path + " must be an object");
    }

    auto indicator = StrategyParser::indicator_from_json(j, path);
    if (indicator.is_error()) {
        return forward_error<Rule>(*indicator.error());
    }

    Rule rule;
    rule.indicator = indicator.take_value();

    if (!j.contains("condition") || !j.at("condition").is_string()) {
        return invalid<Rule>(path + ".condition is required");
    }
    auto condition = condition_from_string(j.at("condition").get<std::string>());
    if (!condition) {
        return invalid<Rule>(path + ".condition: unknown condition '" +
                             j.at("condition").get<std::string>() + "'");
    }
    rule.condition = *condition;

    if (!j.contains("compare_to") || j.at("compare_to").is_null()) {
        return invalid<Rule>(path + ".compare_to is required");
    }
    const auto& compare_to = j.at("compare_to");
    const std::string compare_path = path + ".compare_to";

    if (compare_to.is_number()) {
        rule.compare_to = compare_to.get<double>();
    } else if (compare_to.is_string()) {
        // Another output line of the same indicator, e.g. the MACD signal line
        const std::string line = compare_to.get<std::string>();
        auto output = indicator_output_from_string(rule.indicator.kind(), line);
        if (!output) {
            return invalid<Rule>(compare_path + ": '" + line + "' is not an output of '" +
                                 indicator_kind_to_string(rule.indicator.kind()) + "'");
        }
        IndicatorRef other = rule.indicator;
        other.output = *output;
        rule.compare_to = other;
    } else if (compare_to.is_object()) {
        auto other = StrategyParser::indicator_from_json(compare_to, compare_path);
        if (other.is_error()) {
            return forward_error<Rule>(*other.error());
        }
        rule.compare_to = other.take_value();
    } else {
        return invalid<Rule>(compare_path + " must be a number, a string or an indicator object");
    }

    return Result<Rule>(std::move(rule));
}

Result<std::vector<Rule>> rules_from_json(const nlohmann::json& j, const std::string& key,
                                          bool required) {
    std::vector<Rule> rules;
    if (!j.contains(key) || j.at(key).is_null()) {
        if (required) {
            return invalid<std::vector<Rule>>(key + " is required");
        }
        return Result<std::vector<Rule>>(std::move(rules));
    }
    if (!j.at(key).is_array()) {
        return invalid<std::vector<Rule>>(key + " must be an array");
    }

    const auto& array = j.at(key);
    for (size_t i = 0; i < array.size(); ++i) {
        auto rule = rule_from_json(array[i], key + "[" + std::to_string(i) + "]");
        if (rule.is_error()) {
            return forward_error<std::vector<Rule>>(*rule.error());
        }
        rules.push_back(rule.take_value());
    }
    return Result<std::vector<Rule>>(std::move(rules));
}

Result<std::optional<double>> optional_fraction(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return Result<std::optional<double>>(std::optional<double>());
    }
    if (!j.at(key).is_number()) {
        return invalid<std::optional<double>>(key + " must be a number or null");
    }
    return Result<std::optional<double>>(std::optional<double>(j.at(key).get<double>()));
}

nlohmann::json rule_to_json(const Rule& rule) {
    nlohmann::json j = StrategyParser::indicator_to_json(rule.indicator);
    j["condition"] = condition_to_string(rule.condition);
    if (const auto* other = std::get_if<IndicatorRef>(&rule.compare_to)) {
        j["compare_to"] = StrategyParser::indicator_to_json(*other);
    } else {
        j["compare_to"] = std::get<double>(rule.compare_to);
    }
    return j;
}

}  // namespace

Result<IndicatorRef> StrategyParser::indicator_from_json(const nlohmann::json& j,
                                                         const std::string& path) {
    if (!j.contains("indicator") || !j.at("indicator").is_string()) {
        return invalid<IndicatorRef>(path + ".indicator is required");
    }
    const std::string name = j.at("indicator").get<std::string>();
    auto kind = indicator_kind_from_string(name);
    if (!kind) {
        return invalid<IndicatorRef>(path + ".indicator: unknown indicator '" + name + "'");
    }

    nlohmann::json params = nlohmann::json::object();
    if (j.contains("params") && !j.at("params").is_null()) {
        if (!j.at("params").is_object()) {
            return invalid<IndicatorRef>(path + ".params must be an object");
        }
        params = j.at("params");
    }

    auto parsed = params_from_json(*kind, params, path + ".params");
    if (parsed.is_error()) {
        return forward_error<IndicatorRef>(*parsed.error());
    }

    IndicatorRef ref;
    ref.params = parsed.take_value();
    ref.output = default_output(*kind);

    if (j.contains("output") && !j.at("output").is_null()) {
        const auto& value = j.at("output");
        std::optional<IndicatorOutput> output;
        if (value.is_string()) {
            output = indicator_output_from_string(*kind, value.get<std::string>());
        }
        if (!output) {
            return invalid<IndicatorRef>(path + ".output: " + value.dump() +
                                         " is not an output of '" + name + "'");
        }
        ref.output = *output;
    }
    return Result<IndicatorRef>(std::move(ref));
}

nlohmann::json StrategyParser::indicator_to_json(const IndicatorRef& ref) {
    nlohmann::json j;
    j["indicator"] = indicator_kind_to_string(ref.kind());
    j["params"] = params_to_json(ref);
    if (ref.output != default_output(ref.kind())) {
        j["output"] = indicator_output_to_string(ref.output);
    }
    return j;
}

Result<StrategyDefinition> StrategyParser::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return invalid<StrategyDefinition>("strategy must be a JSON object");
    }

    StrategyDefinition definition;

    if (!j.contains("name") || !j.at("name").is_string() ||
        j.at("name").get<std::string>().empty()) {
        return invalid<StrategyDefinition>("name is required");
    }
    definition.name = j.at("name").get<std::string>();

    if (j.contains("description") && j.at("description").is_string()) {
        definition.description = j.at("description").get<std::string>();
    }

    auto entry = rules_from_json(j, "entry_rules", true);
    if (entry.is_error()) {
        return forward_error<StrategyDefinition>(*entry.error());
    }
    definition.entry_rules = entry.take_value();

    auto exit = rules_from_json(j, "exit_rules", false);
    if (exit.is_error()) {
        return forward_error<StrategyDefinition>(*exit.error());
    }
    definition.exit_rules = exit.take_value();

    if (j.contains("position_size") && !j.at("position_size").is_null()) {
        if (!j.at("position_size").is_number()) {
            return invalid<StrategyDefinition>("position_size must be a number");
        }
        definition.position_size = j.at("position_size").get<double>();
    }

    auto max_positions = read_int(j, "max_positions", definition.max_positions, "strategy");
    if (max_positions.is_error()) {
        return forward_error<StrategyDefinition>(*max_positions.error());
    }
    definition.max_positions = max_positions.value();

    auto stop_loss = optional_fraction(j, "stop_loss");
    if (stop_loss.is_error()) {
        return forward_error<StrategyDefinition>(*stop_loss.error());
    }
    definition.stop_loss = stop_loss.value();

    auto take_profit = optional_fraction(j, "take_profit");
    if (take_profit.is_error()) {
        return forward_error<StrategyDefinition>(*take_profit.error());
    }
    definition.take_profit = take_profit.value();

    auto valid = definition.validate();
    if (valid.is_error()) {
        return forward_error<StrategyDefinition>(*valid.error());
    }
    return Result<StrategyDefinition>(std::move(definition));
}

Result<StrategyDefinition> StrategyParser::parse(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<StrategyDefinition>(ErrorCode::JSON_PARSE_ERROR,
                                              std::string("Malformed strategy JSON: ") + e.what(),
                                              COMPONENT);
    }
    return from_json(j);
}

Result<StrategyDefinition> StrategyParser::load_from_file(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        return make_error<StrategyDefinition>(ErrorCode::FILE_NOT_FOUND,
                                              "Strategy file not found: " + filepath, COMPONENT);
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<StrategyDefinition>(ErrorCode::FILE_IO_ERROR,
                                              "Failed to open strategy file: " + filepath,
                                              COMPONENT);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

nlohmann::json StrategyParser::to_json(const StrategyDefinition& definition) {
    nlohmann::json j;
    j["name"] = definition.name;
    j["description"] = definition.description;

    j["entry_rules"] = nlohmann::json::array();
    for (const auto& rule : definition.entry_rules) {
        j["entry_rules"].push_back(rule_to_json(rule));
    }
    j["exit_rules"] = nlohmann::json::array();
    for (const auto& rule : definition.exit_rules) {
        j["exit_rules"].push_back(rule_to_json(rule));
    }

    j["position_size"] = definition.position_size;
    j["max_positions"] = definition.max_positions;
    j["stop_loss"] = definition.stop_loss ? nlohmann::json(*definition.stop_loss) : nullptr;
    j["take_profit"] = definition.take_profit ? nlohmann::json(*definition.take_profit) : nullptr;
    return j;
}

}  // namespace stratlab
