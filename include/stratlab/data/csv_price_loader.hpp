// include/stratlab/data/csv_price_loader.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "stratlab/core/config_base.hpp"
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"

namespace stratlab {

/**
 * @brief Layout of an OHLCV CSV file
 */
struct CsvLoaderConfig : public ConfigBase {
    std::string timestamp_column{"date"};
    char delimiter{','};
    int32_t block_size{1 << 20};  // Bytes per Arrow read block

    // Configuration metadata
    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["timestamp_column"] = timestamp_column;
        j["delimiter"] = std::string(1, delimiter);
        j["block_size"] = block_size;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("timestamp_column"))
            timestamp_column = j.at("timestamp_column").get<std::string>();
        if (j.contains("delimiter")) {
            std::string value = j.at("delimiter").get<std::string>();
            if (!value.empty())
                delimiter = value[0];
        }
        if (j.contains("block_size"))
            block_size = j.at("block_size").get<int32_t>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Reads OHLCV bars from CSV files with the Arrow CSV reader
 *
 * Rows are sorted by timestamp after loading. Duplicate timestamps are
 * rejected with INVALID_DATA.
 */
class CsvPriceLoader {
public:
    explicit CsvPriceLoader(CsvLoaderConfig config = CsvLoaderConfig());

    /**
     * @brief Load a CSV file
     * @param path File path
     * @param symbol Symbol stamped on bars when the file has no symbol column
     * @return FILE_NOT_FOUND, FILE_IO_ERROR, CONVERSION_ERROR or INVALID_DATA on failure
     */
    Result<std::vector<Bar>> load(const std::string& path, const std::string& symbol) const;

    /**
     * @brief Drop rows with non-finite values, sort by time and reject
     * duplicate timestamps
     */
    static Result<std::vector<Bar>> sort_and_validate(std::vector<Bar> bars);

private:
    CsvLoaderConfig config_;
};

}  // namespace stratlab
