// include/stratlab/backtest/backtest_metrics_calculator.hpp
#pragma once

#include <optional>
#include <utility>
#include <vector>
#include "stratlab/backtest/backtest_types.hpp"
#include "stratlab/core/types.hpp"

namespace stratlab {

/**
 * @brief Pure stateless calculation component for backtest metrics
 *
 * All methods are const and have no side effects. Degenerate inputs give an
 * absent value (std::optional) rather than zero or infinity.
 */
class BacktestMetricsCalculator {
public:
    BacktestMetricsCalculator() = default;
    ~BacktestMetricsCalculator() = default;

    // ========== Return Calculations ==========

    /**
     * @brief Absolute gain over the run
     */
    double calculate_total_return(double start_value, double end_value) const;

    /**
     * @brief Gain as a percentage of the starting value (10.0 = 10%)
     */
    double calculate_total_return_pct(double start_value, double end_value) const;

    /**
     * @brief Per-bar simple returns of the equity curve
     * @param equity_curve Vector of (timestamp, equity) pairs
     * @return One return per consecutive pair with a positive prior value
     */
    std::vector<double> calculate_returns_from_equity(const backtest::EquityCurve& equity_curve) const;

    // ========== Risk-Adjusted Return Metrics ==========

    /**
     * @brief Annualized Sharpe ratio with a zero risk-free rate
     * @param returns Per-bar returns
     * @param periods_per_year Bars per year used to annualize (252 for daily)
     * @return mean / sample stdev * sqrt(periods_per_year), or std::nullopt with
     *         fewer than two returns or zero deviation
     */
    std::optional<double> calculate_sharpe_ratio(const std::vector<double>& returns,
                                                 int periods_per_year) const;

    // ========== Drawdown Metrics ==========

    struct Drawdown {
        double amount = 0.0;  // Largest peak-to-trough decline in currency
        double pct = 0.0;     // That decline as a percentage of its running peak
    };

    /**
     * @brief Drawdown curve from a running-maximum scan
     * @return Vector of (timestamp, drawdown) pairs as fractions of the running peak
     */
    std::vector<std::pair<Timestamp, double>> calculate_drawdowns(
        const backtest::EquityCurve& equity_curve) const;

    Drawdown calculate_max_drawdown(const backtest::EquityCurve& equity_curve) const;

    // ========== Trade Statistics ==========

    /**
     * @brief Trade statistics result structure
     */
    struct TradeStatistics {
        int total_trades = 0;
        int completed_trades = 0;  // Excludes trades closed at end of data
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;
        std::optional<double> profit_factor;
        double total_profit = 0.0;
        double total_loss = 0.0;  // Magnitude of the summed losing pnl
        double avg_win = 0.0;
        double avg_loss = 0.0;    // Magnitude of the mean losing pnl
        double total_commission = 0.0;
    };

    /**
     * @brief Classify trades and aggregate their pnl
     *
     * Incomplete trades count toward total_trades only. Zero-pnl trades are
     * neither winners nor losers.
     */
    TradeStatistics calculate_trade_statistics(const std::vector<backtest::Trade>& trades) const;

    // ========== Composite Calculation ==========

    /**
     * @brief Fill every metric of a result from a simulation trace
     * @param result Result to populate; identity fields are left untouched
     * @param trace Output of the simulation loop
     * @param config Capital and annualization settings of the run
     */
    void calculate_all_metrics(backtest::BacktestResult& result,
                               const backtest::SimulationTrace& trace,
                               const backtest::BacktestConfig& config) const;

private:
    double calculate_mean(const std::vector<double>& values) const;

    /**
     * @brief Sample standard deviation (n - 1 denominator)
     */
    double calculate_std_dev(const std::vector<double>& values, double mean) const;
};

}  // namespace stratlab
