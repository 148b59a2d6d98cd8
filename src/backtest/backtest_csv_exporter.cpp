// src/backtest/backtest_csv_exporter.cpp
#include "stratlab/backtest/backtest_csv_exporter.hpp"
#include <filesystem>
#include <iomanip>
#include "stratlab/backtest/backtest_metrics_calculator.hpp"
#include "stratlab/core/logger.hpp"
#include "stratlab/core/time_utils.hpp"

namespace stratlab {
namespace backtest {

BacktestCSVExporter::BacktestCSVExporter(const std::string& output_directory)
    : output_directory_(output_directory) {}

BacktestCSVExporter::~BacktestCSVExporter() {
    finalize();
}

Result<void> BacktestCSVExporter::initialize_files() {
    try {
        std::filesystem::create_directories(output_directory_);

        trades_file_.open(std::filesystem::path(output_directory_) / "trades.csv");
        if (!trades_file_.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open trades.csv for writing",
                                    "BacktestCSVExporter");
        }
        trades_file_ << "entry_time,exit_time,entry_bar,exit_bar,entry_price,exit_price,size,"
                     << "gross_pnl,commission,pnl,return_pct,exit_reason,incomplete\n";

        equity_file_.open(std::filesystem::path(output_directory_) / "equity_curve.csv");
        if (!equity_file_.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open equity_curve.csv for writing",
                                    "BacktestCSVExporter");
        }
        equity_file_ << "date,equity,drawdown_pct\n";

        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error initializing CSV files: ") + e.what(),
                                "BacktestCSVExporter");
    }
}

Result<void> BacktestCSVExporter::append_trades(const BacktestResult& result) {
    if (!trades_file_.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "trades.csv file is not open",
                                "BacktestCSVExporter");
    }

    trades_file_ << std::setprecision(10);
    for (const auto& trade : result.trades) {
        trades_file_ << core::format_date(trade.entry_time) << ","
                     << core::format_date(trade.exit_time) << "," << trade.entry_bar << ","
                     << trade.exit_bar << "," << trade.entry_price << "," << trade.exit_price
                     << "," << trade.size << "," << trade.gross_pnl << "," << trade.commission
                     << "," << trade.pnl << "," << trade.return_pct << ","
                     << exit_reason_to_string(trade.exit_reason) << ","
                     << (trade.incomplete ? "true" : "false") << "\n";
    }

    if (!trades_file_) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing trades.csv",
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::append_equity_curve(const BacktestResult& result) {
    if (!equity_file_.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "equity_curve.csv file is not open",
                                "BacktestCSVExporter");
    }

    BacktestMetricsCalculator calculator;
    auto drawdowns = calculator.calculate_drawdowns(result.equity_curve);

    equity_file_ << std::setprecision(10);
    for (size_t i = 0; i < result.equity_curve.size(); ++i) {
        equity_file_ << core::format_date(result.equity_curve[i].first) << ","
                     << result.equity_curve[i].second << "," << drawdowns[i].second * 100.0
                     << "\n";
    }

    if (!equity_file_) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing equity_curve.csv",
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::write_result_json(const BacktestResult& result) const {
    std::filesystem::path path = std::filesystem::path(output_directory_) / "result.json";
    std::ofstream file(path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open " + path.string() + " for writing",
                                "BacktestCSVExporter");
    }
    file << std::setw(4) << result.to_json() << std::endl;
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_result(const BacktestResult& result) {
    auto init = initialize_files();
    if (init.is_error()) {
        return init;
    }
    auto trades = append_trades(result);
    if (trades.is_error()) {
        return trades;
    }
    auto equity = append_equity_curve(result);
    if (equity.is_error()) {
        return equity;
    }
    finalize();

    auto json = write_result_json(result);
    if (json.is_error()) {
        return json;
    }

    INFO("Exported " << result.trades.size() << " trades and " << result.equity_curve.size()
                     << " equity points to " << output_directory_);
    return Result<void>();
}

void BacktestCSVExporter::finalize() {
    if (trades_file_.is_open()) {
        trades_file_.close();
    }
    if (equity_file_.is_open()) {
        equity_file_.close();
    }
}

}  // namespace backtest
}  // namespace stratlab
