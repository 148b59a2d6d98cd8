// src/data/conversion_utils.cpp
#include "stratlab/data/conversion_utils.hpp"
#include <arrow/type_traits.h>
#include <limits>

namespace stratlab {

Result<std::vector<Bar>> DataConversionUtils::arrow_table_to_bars(
    const std::shared_ptr<arrow::Table>& table, const std::string& symbol,
    const std::string& timestamp_column) {
    if (!table) {
        return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                            "DataConversionUtils");
    }

    // Verify required columns exist
    std::vector<std::string> required_columns = {timestamp_column, "open", "high",
                                                 "low",            "close", "volume"};

    for (const auto& col : required_columns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<std::vector<Bar>>(ErrorCode::INVALID_DATA,
                                                "Missing required column: " + col,
                                                "DataConversionUtils");
        }
    }

    std::vector<Bar> bars;
    if (table->num_rows() == 0) {
        return Result<std::vector<Bar>>(std::move(bars));
    }

    try {
        // Readers may split large files into several chunks
        auto combined = table->CombineChunks(arrow::default_memory_pool());
        if (!combined.ok()) {
            return make_error<std::vector<Bar>>(
                ErrorCode::CONVERSION_ERROR,
                "Failed to combine table chunks: " + combined.status().ToString(),
                "DataConversionUtils");
        }
        std::shared_ptr<arrow::Table> flat = *combined;

        auto time_array = flat->GetColumnByName(timestamp_column)->chunk(0);
        auto open_array = flat->GetColumnByName("open")->chunk(0);
        auto high_array = flat->GetColumnByName("high")->chunk(0);
        auto low_array = flat->GetColumnByName("low")->chunk(0);
        auto close_array = flat->GetColumnByName("close")->chunk(0);
        auto volume_array = flat->GetColumnByName("volume")->chunk(0);

        std::shared_ptr<arrow::Array> symbol_array;
        if (auto symbol_column = flat->GetColumnByName("symbol")) {
            symbol_array = symbol_column->chunk(0);
        }

        bars.reserve(flat->num_rows());

        for (int64_t i = 0; i < flat->num_rows(); ++i) {
            auto ts_result = extract_timestamp(time_array, i);
            if (ts_result.is_error()) {
                return make_error<std::vector<Bar>>(ts_result.error()->code(),
                                                    ts_result.error()->what(),
                                                    "DataConversionUtils");
            }

            std::string bar_symbol = symbol;
            if (symbol_array) {
                auto symbol_result = extract_string(symbol_array, i);
                if (symbol_result.is_error()) {
                    return make_error<std::vector<Bar>>(symbol_result.error()->code(),
                                                        symbol_result.error()->what(),
                                                        "DataConversionUtils");
                }
                bar_symbol = symbol_result.value();
            }

            auto open_result = extract_double(open_array, i);
            auto high_result = extract_double(high_array, i);
            auto low_result = extract_double(low_array, i);
            auto close_result = extract_double(close_array, i);
            auto volume_result = extract_double(volume_array, i);

            if (open_result.is_error() || high_result.is_error() || low_result.is_error() ||
                close_result.is_error() || volume_result.is_error()) {
                return make_error<std::vector<Bar>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Error extracting OHLCV values at row " + std::to_string(i),
                    "DataConversionUtils");
            }

            bars.emplace_back(ts_result.value(), open_result.value(), high_result.value(),
                              low_result.value(), close_result.value(), volume_result.value(),
                              bar_symbol);
        }

        return Result<std::vector<Bar>>(std::move(bars));

    } catch (const std::exception& e) {
        return make_error<std::vector<Bar>>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to bars: ") + e.what(), "DataConversionUtils");
    }
}

Result<Timestamp> DataConversionUtils::extract_timestamp(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     "DataConversionUtils");
    }

    if (array->type_id() != arrow::Type::TIMESTAMP) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Expected a timestamp column, got " +
                                         array->type()->ToString(),
                                     "DataConversionUtils");
    }

    auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
    if (ts_array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null timestamp value at index " + std::to_string(index),
                                     "DataConversionUtils");
    }

    const int64_t ts_value = ts_array->Value(index);
    const auto& ts_type = static_cast<const arrow::TimestampType&>(*array->type());

    std::chrono::system_clock::duration since_epoch;
    switch (ts_type.unit()) {
        case arrow::TimeUnit::SECOND:
            since_epoch = std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(ts_value));
            break;
        case arrow::TimeUnit::MILLI:
            since_epoch = std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::milliseconds(ts_value));
            break;
        case arrow::TimeUnit::MICRO:
            since_epoch = std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::microseconds(ts_value));
            break;
        case arrow::TimeUnit::NANO:
        default:
            since_epoch = std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::nanoseconds(ts_value));
            break;
    }

    return Result<Timestamp>(Timestamp(since_epoch));
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  "DataConversionUtils");
    }

    if (array->type_id() != arrow::Type::DOUBLE) {
        return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                  "Expected a double column, got " + array->type()->ToString(),
                                  "DataConversionUtils");
    }

    auto double_array = std::static_pointer_cast<arrow::DoubleArray>(array);
    if (double_array->IsNull(index)) {
        return Result<double>(std::numeric_limits<double>::quiet_NaN());
    }

    return Result<double>(double_array->Value(index));
}

Result<std::string> DataConversionUtils::extract_string(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       "DataConversionUtils");
    }

    if (array->type_id() != arrow::Type::STRING) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Expected a string column, got " +
                                           array->type()->ToString(),
                                       "DataConversionUtils");
    }

    auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
    if (string_array->IsNull(index)) {
        return make_error<std::string>(ErrorCode::INVALID_DATA,
                                       "Null string value at index " + std::to_string(index),
                                       "DataConversionUtils");
    }

    return Result<std::string>(string_array->GetString(index));
}

}  // namespace stratlab
