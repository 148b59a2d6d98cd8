// include/stratlab/backtest/simulation_engine.hpp
#pragma once

#include <optional>
#include <vector>
#include "stratlab/backtest/backtest_types.hpp"
#include "stratlab/core/error.hpp"
#include "stratlab/strategy/strategy_definition.hpp"
#include "stratlab/strategy/strategy_predicate.hpp"

namespace stratlab {
namespace backtest {

/**
 * @brief Bar-by-bar FLAT / IN_POSITION state machine
 *
 * Orders execute at the close of the signal bar. At most one transition
 * happens per bar, so a position never opens and closes on the same bar.
 * Equity is recorded for every bar, warm-up bars included.
 */
class SimulationEngine {
public:
    explicit SimulationEngine(BacktestConfig config);

    /**
     * @brief Run the loop over a validated series
     * @param bars Price series, strictly increasing timestamps
     * @param definition Validated strategy
     * @param predicate Entry/exit decisions over the run's indicator context
     * @return Trades, equity curve and per-bar states
     */
    Result<SimulationTrace> run(const std::vector<Bar>& bars, const StrategyDefinition& definition,
                                const StrategyPredicate& predicate) const;

private:
    BacktestConfig config_;

    /**
     * @brief Protective exit triggered by the bar close, if any
     */
    std::optional<ExitReason> protective_exit(const OpenPosition& position, Price close,
                                              const StrategyDefinition& definition) const;

    Trade close_position(const OpenPosition& position, const Bar& bar, size_t bar_index,
                         ExitReason reason, double& cash) const;
};

}  // namespace backtest
}  // namespace stratlab
