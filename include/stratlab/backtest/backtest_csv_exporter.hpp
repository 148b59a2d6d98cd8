// include/stratlab/backtest/backtest_csv_exporter.hpp
#pragma once

#include <fstream>
#include <string>
#include "stratlab/backtest/backtest_types.hpp"
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"

namespace stratlab {
namespace backtest {

/**
 * @brief Writes backtest results to an output directory
 *
 * Produces trades.csv, equity_curve.csv (with the drawdown from the running
 * peak) and result.json.
 */
class BacktestCSVExporter {
public:
    BacktestCSVExporter(const std::string& output_directory);
    ~BacktestCSVExporter();

    Result<void> initialize_files();

    Result<void> append_trades(const BacktestResult& result);

    Result<void> append_equity_curve(const BacktestResult& result);

    /**
     * @brief Write the full result as JSON next to the CSV files
     */
    Result<void> write_result_json(const BacktestResult& result) const;

    /**
     * @brief Initialize the files and write every output for a result
     */
    Result<void> export_result(const BacktestResult& result);

    void finalize();

    const std::string& output_directory() const {
        return output_directory_;
    }

private:
    std::string output_directory_;
    std::ofstream trades_file_;
    std::ofstream equity_file_;
};

}  // namespace backtest
}  // namespace stratlab
