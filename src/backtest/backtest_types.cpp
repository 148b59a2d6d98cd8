// src/backtest/backtest_types.cpp

#include "stratlab/backtest/backtest_types.hpp"
#include <cmath>
#include "stratlab/core/time_utils.hpp"

namespace stratlab {
namespace backtest {

namespace {

nlohmann::json optional_to_json(const std::optional<double>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

}  // namespace

std::string exit_reason_to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::SIGNAL:
            return "signal";
        case ExitReason::STOP_LOSS:
            return "stop_loss";
        case ExitReason::TAKE_PROFIT:
            return "take_profit";
        case ExitReason::END_OF_DATA:
            return "end_of_data";
        default:
            return "unknown";
    }
}

std::string position_state_to_string(PositionState state) {
    return state == PositionState::IN_POSITION ? "IN_POSITION" : "FLAT";
}

Result<void> BacktestConfig::validate() const {
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "initial_capital must be positive, got " +
                                    std::to_string(initial_capital),
                                "BacktestConfig");
    }
    if (!std::isfinite(commission_rate) || commission_rate < 0.0 || commission_rate >= 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "commission_rate must be in [0, 1), got " +
                                    std::to_string(commission_rate),
                                "BacktestConfig");
    }
    if (trading_periods_per_year < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "trading_periods_per_year must be at least 1, got " +
                                    std::to_string(trading_periods_per_year),
                                "BacktestConfig");
    }
    return Result<void>();
}

nlohmann::json Trade::to_json() const {
    nlohmann::json j;
    j["entry_time"] = core::format_date(entry_time);
    j["exit_time"] = core::format_date(exit_time);
    j["entry_bar"] = entry_bar;
    j["exit_bar"] = exit_bar;
    j["entry_price"] = entry_price;
    j["exit_price"] = exit_price;
    j["size"] = size;
    j["gross_pnl"] = gross_pnl;
    j["commission"] = commission;
    j["pnl"] = pnl;
    j["return_pct"] = return_pct;
    j["exit_reason"] = exit_reason_to_string(exit_reason);
    j["incomplete"] = incomplete;
    return j;
}

nlohmann::json BacktestResult::to_json() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["asset_class"] = asset_class_to_string(asset_class);
    j["timeframe"] = frequency_to_string(timeframe);
    j["strategy_name"] = strategy_name;
    j["start_date"] = core::format_date(start_date);
    j["end_date"] = core::format_date(end_date);
    j["initial_capital"] = initial_capital;
    j["final_value"] = final_value;
    j["total_return"] = total_return;
    j["total_return_pct"] = total_return_pct;
    j["sharpe_ratio"] = optional_to_json(sharpe_ratio);
    j["max_drawdown"] = max_drawdown;
    j["max_drawdown_pct"] = max_drawdown_pct;
    j["win_rate"] = win_rate;
    j["total_trades"] = total_trades;
    j["completed_trades"] = completed_trades;
    j["winning_trades"] = winning_trades;
    j["losing_trades"] = losing_trades;
    j["avg_win"] = avg_win;
    j["avg_loss"] = avg_loss;
    j["profit_factor"] = optional_to_json(profit_factor);
    j["total_commission"] = total_commission;

    j["equity_curve"] = nlohmann::json::array();
    for (const auto& [timestamp, equity] : equity_curve) {
        j["equity_curve"].push_back({{"date", core::format_date(timestamp)}, {"equity", equity}});
    }

    j["trades"] = nlohmann::json::array();
    for (const auto& trade : trades) {
        j["trades"].push_back(trade.to_json());
    }
    return j;
}

}  // namespace backtest
}  // namespace stratlab
