// include/stratlab/backtest/backtest_engine.hpp
#pragma once

#include <vector>
#include "stratlab/backtest/backtest_metrics_calculator.hpp"
#include "stratlab/backtest/backtest_types.hpp"
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"

namespace stratlab {
namespace backtest {

/**
 * @brief Backtesting engine for a single rule-based strategy on one symbol
 *
 * A run validates its inputs, computes the indicator series once, walks the
 * bars and derives the metrics. The result is all-or-nothing: any failure
 * returns an error and no partial result. Runs share no mutable state, so
 * one engine may serve concurrent runs.
 */
class BacktestEngine {
public:
    /**
     * @brief Constructor
     * @param config Backtest configuration
     */
    explicit BacktestEngine(BacktestConfig config);

    /**
     * @brief Run a backtest
     * @param request Symbol, bars and strategy
     * @return Result containing the backtest result, or INVALID_ARGUMENT,
     *         INVALID_STRATEGY, INVALID_DATA, INSUFFICIENT_DATA or ENGINE_FAILURE
     */
    Result<BacktestResult> run(const BacktestRequest& request) const;

    /**
     * @brief Check that bars are non-empty with strictly increasing timestamps
     */
    static Result<void> validate_bars(const std::vector<Bar>& bars);

    const BacktestConfig& config() const {
        return config_;
    }

private:
    BacktestConfig config_;
    BacktestMetricsCalculator metrics_calculator_;

    Result<BacktestResult> run_unchecked(const BacktestRequest& request) const;
};

}  // namespace backtest
}  // namespace stratlab
