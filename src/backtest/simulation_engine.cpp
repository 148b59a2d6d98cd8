// src/backtest/simulation_engine.cpp

#include "stratlab/backtest/simulation_engine.hpp"
#include "stratlab/core/logger.hpp"
#include "stratlab/core/time_utils.hpp"

namespace stratlab {
namespace backtest {

SimulationEngine::SimulationEngine(BacktestConfig config) : config_(std::move(config)) {}

std::optional<ExitReason> SimulationEngine::protective_exit(
    const OpenPosition& position, Price close, const StrategyDefinition& definition) const {
    if (definition.stop_loss && close <= position.entry_price * (1.0 - *definition.stop_loss)) {
        return ExitReason::STOP_LOSS;
    }
    if (definition.take_profit &&
        close >= position.entry_price * (1.0 + *definition.take_profit)) {
        return ExitReason::TAKE_PROFIT;
    }
    return std::nullopt;
}

Trade SimulationEngine::close_position(const OpenPosition& position, const Bar& bar,
                                       size_t bar_index, ExitReason reason, double& cash) const {
    Trade trade;
    trade.entry_time = position.entry_time;
    trade.entry_bar = position.entry_bar;
    trade.entry_price = position.entry_price;
    trade.size = position.size;
    trade.exit_time = bar.timestamp;
    trade.exit_bar = bar_index;
    trade.exit_price = bar.close;
    trade.exit_reason = reason;
    trade.incomplete = reason == ExitReason::END_OF_DATA;

    // The synthetic end-of-data close only marks the position for reporting
    double exit_commission =
        trade.incomplete ? 0.0 : bar.close * position.size * config_.commission_rate;

    cash += bar.close * position.size - exit_commission;

    trade.gross_pnl = (trade.exit_price - trade.entry_price) * trade.size;
    trade.commission = position.entry_commission + exit_commission;
    trade.pnl = trade.gross_pnl - trade.commission;
    double notional = trade.entry_price * trade.size;
    trade.return_pct = notional > 0.0 ? trade.pnl / notional : 0.0;
    return trade;
}

Result<SimulationTrace> SimulationEngine::run(const std::vector<Bar>& bars,
                                              const StrategyDefinition& definition,
                                              const StrategyPredicate& predicate) const {
    if (bars.empty()) {
        return make_error<SimulationTrace>(ErrorCode::INVALID_DATA,
                                           "Cannot simulate over an empty price series",
                                           "SimulationEngine");
    }

    SimulationTrace trace;
    trace.equity_curve.reserve(bars.size());
    trace.states.reserve(bars.size());

    double cash = config_.initial_capital;
    std::optional<OpenPosition> position;

    for (size_t i = 0; i < bars.size(); ++i) {
        const Bar& bar = bars[i];

        if (position) {
            if (i > position->entry_bar) {
                std::optional<ExitReason> reason = protective_exit(*position, bar.close, definition);
                if (!reason && predicate.should_exit(i)) {
                    reason = ExitReason::SIGNAL;
                }
                if (reason) {
                    Trade trade = close_position(*position, bar, i, *reason, cash);
                    trace.total_commission += trade.commission - position->entry_commission;
                    DEBUG("Exit " << exit_reason_to_string(*reason) << " at bar " << i << " ("
                                  << core::format_date(bar.timestamp) << ") price " << bar.close
                                  << " pnl " << trade.pnl);
                    trace.trades.push_back(std::move(trade));
                    position.reset();
                }
            }
        } else if (predicate.should_enter(i)) {
            if (bar.close <= 0.0) {
                WARN("Ignoring entry signal at bar " << i << ": non-positive close " << bar.close);
            } else {
                OpenPosition opened;
                opened.entry_bar = i;
                opened.entry_time = bar.timestamp;
                opened.entry_price = bar.close;
                // Notional plus entry commission equals position_size * cash
                opened.size = definition.position_size * cash /
                              (bar.close * (1.0 + config_.commission_rate));
                opened.entry_commission = bar.close * opened.size * config_.commission_rate;

                cash -= bar.close * opened.size + opened.entry_commission;
                trace.total_commission += opened.entry_commission;
                DEBUG("Entry at bar " << i << " (" << core::format_date(bar.timestamp)
                                      << ") price " << bar.close << " size " << opened.size);
                position = opened;
            }
        }

        double equity = cash;
        if (position) {
            equity += position->size * bar.close;
        }
        trace.equity_curve.emplace_back(bar.timestamp, equity);
        trace.states.push_back(position ? PositionState::IN_POSITION : PositionState::FLAT);
    }

    if (position) {
        const size_t last = bars.size() - 1;
        Trade trade = close_position(*position, bars[last], last, ExitReason::END_OF_DATA, cash);
        DEBUG("Force-closed open position at end of data, pnl " << trade.pnl);
        trace.trades.push_back(std::move(trade));
        position.reset();
    }

    trace.final_cash = cash;
    return Result<SimulationTrace>(std::move(trace));
}

}  // namespace backtest
}  // namespace stratlab
