// src/data/csv_price_loader.cpp
#include "stratlab/data/csv_price_loader.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iterator>
#include "stratlab/core/logger.hpp"
#include "stratlab/core/time_utils.hpp"
#include "stratlab/data/conversion_utils.hpp"

namespace stratlab {

CsvPriceLoader::CsvPriceLoader(CsvLoaderConfig config) : config_(std::move(config)) {}

Result<std::vector<Bar>> CsvPriceLoader::load(const std::string& path,
                                              const std::string& symbol) const {
    if (!std::filesystem::exists(path)) {
        return make_error<std::vector<Bar>>(ErrorCode::FILE_NOT_FOUND,
                                            "Price file not found: " + path, "CsvPriceLoader");
    }

    auto input = arrow::io::ReadableFile::Open(path, arrow::default_memory_pool());
    if (!input.ok()) {
        return make_error<std::vector<Bar>>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to open " + path + ": " + input.status().ToString(), "CsvPriceLoader");
    }

    auto read_options = arrow::csv::ReadOptions::Defaults();
    read_options.block_size = config_.block_size;

    auto parse_options = arrow::csv::ParseOptions::Defaults();
    parse_options.delimiter = config_.delimiter;

    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    convert_options.column_types[config_.timestamp_column] =
        arrow::timestamp(arrow::TimeUnit::SECOND);
    for (const char* column : {"open", "high", "low", "close", "volume"}) {
        convert_options.column_types[column] = arrow::float64();
    }

    auto reader = arrow::csv::TableReader::Make(arrow::io::default_io_context(), *input,
                                                read_options, parse_options, convert_options);
    if (!reader.ok()) {
        return make_error<std::vector<Bar>>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to create CSV reader for " + path + ": " + reader.status().ToString(),
            "CsvPriceLoader");
    }

    auto table = (*reader)->Read();
    if (!table.ok()) {
        return make_error<std::vector<Bar>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to parse " + path + ": " + table.status().ToString(), "CsvPriceLoader");
    }

    auto bars = DataConversionUtils::arrow_table_to_bars(*table, symbol, config_.timestamp_column);
    if (bars.is_error()) {
        return make_error<std::vector<Bar>>(bars.error()->code(),
                                            path + ": " + bars.error()->what(),
                                            "CsvPriceLoader");
    }

    DEBUG("Loaded " << bars.value().size() << " bars for " << symbol << " from " << path);
    return sort_and_validate(bars.take_value());
}

Result<std::vector<Bar>> CsvPriceLoader::sort_and_validate(std::vector<Bar> bars) {
    auto first_bad = std::remove_if(bars.begin(), bars.end(), [](const Bar& bar) {
        return !std::isfinite(bar.open) || !std::isfinite(bar.high) || !std::isfinite(bar.low) ||
               !std::isfinite(bar.close) || !std::isfinite(bar.volume);
    });
    if (first_bad != bars.end()) {
        WARN("Dropping " << std::distance(first_bad, bars.end())
                         << " rows with missing or non-finite values");
        bars.erase(first_bad, bars.end());
    }

    std::stable_sort(bars.begin(), bars.end(),
                     [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });

    for (size_t i = 1; i < bars.size(); ++i) {
        if (bars[i].timestamp == bars[i - 1].timestamp) {
            return make_error<std::vector<Bar>>(
                ErrorCode::INVALID_DATA,
                "Duplicate bar timestamp " + core::format_timestamp(bars[i].timestamp),
                "CsvPriceLoader");
        }
    }
    return Result<std::vector<Bar>>(std::move(bars));
}

}  // namespace stratlab
