// include/stratlab/backtest/backtest_app_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include "stratlab/backtest/backtest_types.hpp"
#include "stratlab/core/config_base.hpp"
#include "stratlab/core/logger.hpp"
#include "stratlab/core/types.hpp"
#include "stratlab/data/csv_price_loader.hpp"

namespace stratlab {
namespace backtest {

/**
 * @brief Settings for the bt_strategy command line tool
 *
 * "strategy" holds either an inline strategy object or the path of a
 * strategy JSON file.
 */
struct BacktestAppConfig : public ConfigBase {
    LoggerConfig logger;
    BacktestConfig engine;
    CsvLoaderConfig csv;

    std::string data_directory{"data"};
    std::vector<std::string> symbols;
    AssetClass asset_class{AssetClass::STOCK};
    DataFrequency timeframe{DataFrequency::DAILY};
    std::string start_date;  // YYYY-MM-DD, empty for the whole file
    std::string end_date;
    nlohmann::json strategy;
    std::string output_directory{"results"};
    int timeout_seconds{60};

    // Configuration metadata
    std::string version{"1.0.0"};

    Result<void> validate() const override {
        auto engine_check = engine.validate();
        if (engine_check.is_error()) {
            return engine_check;
        }
        if (symbols.empty()) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Config lists no symbols",
                                    "BacktestAppConfig");
        }
        if (timeout_seconds <= 0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "timeout_seconds must be positive", "BacktestAppConfig");
        }
        return Result<void>();
    }

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["logger"] = logger.to_json();
        j["engine"] = engine.to_json();
        j["csv"] = csv.to_json();
        j["data_directory"] = data_directory;
        j["symbols"] = symbols;
        j["asset_class"] = asset_class_to_string(asset_class);
        j["timeframe"] = frequency_to_string(timeframe);
        j["start_date"] = start_date;
        j["end_date"] = end_date;
        j["strategy"] = strategy;
        j["output_directory"] = output_directory;
        j["timeout_seconds"] = timeout_seconds;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("logger"))
            logger.from_json(j.at("logger"));
        if (j.contains("engine"))
            engine.from_json(j.at("engine"));
        if (j.contains("csv"))
            csv.from_json(j.at("csv"));
        if (j.contains("data_directory"))
            data_directory = j.at("data_directory").get<std::string>();
        if (j.contains("symbols"))
            symbols = j.at("symbols").get<std::vector<std::string>>();
        else if (j.contains("symbol"))
            symbols = {j.at("symbol").get<std::string>()};
        if (j.contains("asset_class"))
            asset_class = asset_class_from_string(j.at("asset_class").get<std::string>());
        if (j.contains("timeframe")) {
            auto parsed = frequency_from_string(j.at("timeframe").get<std::string>());
            if (!parsed) {
                throw std::invalid_argument("Unknown timeframe: " +
                                            j.at("timeframe").get<std::string>());
            }
            timeframe = *parsed;
        }
        if (j.contains("start_date"))
            start_date = j.at("start_date").get<std::string>();
        if (j.contains("end_date"))
            end_date = j.at("end_date").get<std::string>();
        if (j.contains("strategy"))
            strategy = j.at("strategy");
        if (j.contains("output_directory"))
            output_directory = j.at("output_directory").get<std::string>();
        if (j.contains("timeout_seconds"))
            timeout_seconds = j.at("timeout_seconds").get<int>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

}  // namespace backtest
}  // namespace stratlab
