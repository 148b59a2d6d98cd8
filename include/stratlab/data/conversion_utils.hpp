// include/stratlab/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <arrow/type_traits.h>
#include <memory>
#include <string>
#include <vector>
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"

namespace stratlab {

class DataConversionUtils {
public:
    /**
     * @brief Convert Arrow Table to vector of Bars
     * @param table Arrow table with a timestamp column and double OHLCV columns
     * @param symbol Symbol used when the table has no "symbol" column
     * @param timestamp_column Name of the timestamp column
     * @return Result containing vector of Bars in table order
     */
    static Result<std::vector<Bar>> arrow_table_to_bars(
        const std::shared_ptr<arrow::Table>& table, const std::string& symbol,
        const std::string& timestamp_column = "date");

private:
    /**
     * @brief Extract timestamp from Arrow array, honoring the column's time unit
     * @param array Arrow array containing timestamps
     * @param index Row index
     * @return Result containing timestamp
     */
    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index);

    /**
     * @brief Extract double value from Arrow array
     * @param array Arrow array containing doubles
     * @param index Row index
     * @return Result containing double value; a null cell reads as NaN
     */
    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);

    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);
};

}  // namespace stratlab
