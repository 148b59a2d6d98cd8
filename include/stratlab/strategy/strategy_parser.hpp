// include/stratlab/strategy/strategy_parser.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "stratlab/core/error.hpp"
#include "stratlab/strategy/strategy_definition.hpp"

namespace stratlab {

/**
 * @brief Converts strategy definitions to and from their JSON form
 *
 * Accepted shape:
 * {
 *   "name": "SMA Crossover",
 *   "description": "...",
 *   "entry_rules": [{"indicator": "sma", "params": {"period": 50},
 *                    "condition": "crosses_above",
 *                    "compare_to": {"indicator": "sma", "params": {"period": 200}}}],
 *   "exit_rules": [...],
 *   "position_size": 1.0, "max_positions": 1,
 *   "stop_loss": 0.05, "take_profit": 0.1
 * }
 *
 * compare_to is a number, an indicator object, or the name of another output
 * line of the rule's own indicator ("signal" for MACD, "lower" for bbands).
 * Errors are INVALID_STRATEGY with the path of the offending field.
 */
class StrategyParser {
public:
    static Result<StrategyDefinition> from_json(const nlohmann::json& j);

    /**
     * @brief Parse JSON text
     * @return JSON_PARSE_ERROR for malformed text, INVALID_STRATEGY otherwise
     */
    static Result<StrategyDefinition> parse(const std::string& text);

    /**
     * @brief Read and parse a strategy file
     * @return FILE_NOT_FOUND if the file cannot be opened
     */
    static Result<StrategyDefinition> load_from_file(const std::string& filepath);

    static nlohmann::json to_json(const StrategyDefinition& definition);

    static nlohmann::json indicator_to_json(const IndicatorRef& ref);

    static Result<IndicatorRef> indicator_from_json(const nlohmann::json& j,
                                                    const std::string& path);
};

}  // namespace stratlab
