// include/stratlab/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "stratlab/core/error.hpp"

namespace stratlab {

/**
 * @brief Base class for all configuration types
 * Provides common serialization and deserialization methods
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to JSON file
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from JSON file, then validate it
     * @param filepath Path to the file
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR, or INVALID_ARGUMENT for
     *         fields of the wrong type or out of range
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Check loaded values, called by load_from_file
     */
    virtual Result<void> validate() const;

    /**
     * @brief Convert configuration to JSON
     * @return JSON representation of the configuration
     */
    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON
     * @param j JSON object to load from
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace stratlab
