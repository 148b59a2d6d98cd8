// include/stratlab/backtest/backtest_types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "stratlab/core/config_base.hpp"
#include "stratlab/core/types.hpp"
#include "stratlab/strategy/strategy_definition.hpp"

namespace stratlab {
namespace backtest {

/**
 * @brief Engine-wide settings for a backtest run
 */
struct BacktestConfig : public ConfigBase {
    double initial_capital{10000.0};
    double commission_rate{0.001};  // Fraction of notional charged on entry and on exit
    int trading_periods_per_year{252};

    // Configuration metadata
    std::string version{"1.0.0"};

    /**
     * @brief Check capital and commission
     * @return INVALID_ARGUMENT when a value is out of range
     */
    Result<void> validate() const override;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["initial_capital"] = initial_capital;
        j["commission_rate"] = commission_rate;
        j["trading_periods_per_year"] = trading_periods_per_year;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("initial_capital"))
            initial_capital = j.at("initial_capital").get<double>();
        if (j.contains("commission_rate"))
            commission_rate = j.at("commission_rate").get<double>();
        // Accept the shorter key used by request payloads
        else if (j.contains("commission"))
            commission_rate = j.at("commission").get<double>();
        if (j.contains("trading_periods_per_year"))
            trading_periods_per_year = j.at("trading_periods_per_year").get<int>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

enum class PositionState { FLAT, IN_POSITION };

enum class ExitReason { SIGNAL, STOP_LOSS, TAKE_PROFIT, END_OF_DATA };

std::string exit_reason_to_string(ExitReason reason);
std::string position_state_to_string(PositionState state);

/**
 * @brief The single open position held while IN_POSITION
 */
struct OpenPosition {
    size_t entry_bar{0};
    Timestamp entry_time;
    Price entry_price{0.0};
    Quantity size{0.0};
    double entry_commission{0.0};
};

/**
 * @brief A closed round trip
 *
 * pnl = gross_pnl - commission, where commission covers entry and exit.
 * return_pct is pnl relative to the entry notional, as a fraction.
 */
struct Trade {
    Timestamp entry_time;
    Timestamp exit_time;
    size_t entry_bar{0};
    size_t exit_bar{0};
    Price entry_price{0.0};
    Price exit_price{0.0};
    Quantity size{0.0};
    double gross_pnl{0.0};
    double commission{0.0};
    double pnl{0.0};
    double return_pct{0.0};
    ExitReason exit_reason{ExitReason::SIGNAL};
    bool incomplete{false};  // Closed synthetically at the end of the data

    nlohmann::json to_json() const;
};

using EquityCurve = std::vector<std::pair<Timestamp, double>>;

/**
 * @brief Raw output of the simulation loop, before statistics
 */
struct SimulationTrace {
    std::vector<Trade> trades;
    EquityCurve equity_curve;
    std::vector<PositionState> states;  // State at the close of each bar
    double final_cash{0.0};
    double total_commission{0.0};
};

/**
 * @brief Input for one backtest run
 */
struct BacktestRequest {
    std::string symbol;
    AssetClass asset_class{AssetClass::STOCK};
    DataFrequency timeframe{DataFrequency::DAILY};
    std::vector<Bar> bars;
    StrategyDefinition strategy;
};

/**
 * @brief Complete outcome of a backtest run
 */
struct BacktestResult {
    std::string symbol;
    AssetClass asset_class{AssetClass::STOCK};
    DataFrequency timeframe{DataFrequency::DAILY};
    std::string strategy_name;
    Timestamp start_date;
    Timestamp end_date;

    // Performance metrics
    double initial_capital{0.0};
    double final_value{0.0};
    double total_return{0.0};
    double total_return_pct{0.0};
    std::optional<double> sharpe_ratio;
    double max_drawdown{0.0};
    double max_drawdown_pct{0.0};

    // Trading metrics
    double win_rate{0.0};
    int total_trades{0};
    int completed_trades{0};
    int winning_trades{0};
    int losing_trades{0};
    double avg_win{0.0};
    double avg_loss{0.0};
    std::optional<double> profit_factor;
    double total_commission{0.0};

    EquityCurve equity_curve;
    std::vector<Trade> trades;

    /**
     * @brief Serialize with "YYYY-MM-DD" dates and null for absent metrics
     */
    nlohmann::json to_json() const;
};

}  // namespace backtest
}  // namespace stratlab
