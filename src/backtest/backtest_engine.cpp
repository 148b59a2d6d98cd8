// src/backtest/backtest_engine.cpp

#include "stratlab/backtest/backtest_engine.hpp"
#include <cmath>
#include "stratlab/backtest/simulation_engine.hpp"
#include "stratlab/core/logger.hpp"
#include "stratlab/core/time_utils.hpp"
#include "stratlab/indicators/indicator_context.hpp"
#include "stratlab/strategy/strategy_predicate.hpp"

namespace stratlab {
namespace backtest {

BacktestEngine::BacktestEngine(BacktestConfig config) : config_(std::move(config)) {}

Result<void> BacktestEngine::validate_bars(const std::vector<Bar>& bars) {
    if (bars.empty()) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Price series is empty", "BacktestEngine");
    }
    for (size_t i = 0; i < bars.size(); ++i) {
        const auto& bar = bars[i];
        if (!std::isfinite(bar.open) || !std::isfinite(bar.high) || !std::isfinite(bar.low) ||
            !std::isfinite(bar.close) || !std::isfinite(bar.volume)) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Bar " + std::to_string(i) + " at " +
                                        core::format_timestamp(bar.timestamp) +
                                        " has a non-finite price or volume",
                                    "BacktestEngine");
        }
        if (i > 0 && bar.timestamp <= bars[i - 1].timestamp) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Bar timestamps must be strictly increasing; bar " +
                                        std::to_string(i) + " at " +
                                        core::format_timestamp(bars[i].timestamp) +
                                        " does not follow " +
                                        core::format_timestamp(bars[i - 1].timestamp),
                                    "BacktestEngine");
        }
    }
    return Result<void>();
}

Result<BacktestResult> BacktestEngine::run(const BacktestRequest& request) const {
    auto config_check = config_.validate();
    if (config_check.is_error()) {
        ERROR("Rejected backtest config: " << config_check.error()->what());
        return forward_error<BacktestResult>(*config_check.error());
    }

    auto strategy_check = request.strategy.validate();
    if (strategy_check.is_error()) {
        ERROR("Rejected strategy '" << request.strategy.name
                                    << "': " << strategy_check.error()->what());
        return forward_error<BacktestResult>(*strategy_check.error());
    }

    auto data_check = validate_bars(request.bars);
    if (data_check.is_error()) {
        ERROR("Rejected price series for " << request.symbol << ": "
                                           << data_check.error()->what());
        return forward_error<BacktestResult>(*data_check.error());
    }

    const int warmup = request.strategy.required_warmup();
    if (request.bars.size() <= static_cast<size_t>(warmup)) {
        return make_error<BacktestResult>(
            ErrorCode::INSUFFICIENT_DATA,
            "Strategy '" + request.strategy.name + "' needs more than " + std::to_string(warmup) +
                " bars of warm-up, got " + std::to_string(request.bars.size()),
            "BacktestEngine");
    }

    try {
        return run_unchecked(request);
    } catch (const EngineError& e) {
        ERROR("Backtest for " << request.symbol << " failed: " << e.to_string());
        return make_error<BacktestResult>(ErrorCode::ENGINE_FAILURE, e.what(), "BacktestEngine");
    } catch (const std::exception& e) {
        ERROR("Backtest for " << request.symbol << " failed: " << e.what());
        return make_error<BacktestResult>(ErrorCode::ENGINE_FAILURE,
                                          std::string("Unexpected failure: ") + e.what(),
                                          "BacktestEngine");
    }
}

Result<BacktestResult> BacktestEngine::run_unchecked(const BacktestRequest& request) const {
    INFO("Starting backtest of '" << request.strategy.name << "' on " << request.symbol << " ("
                                  << request.bars.size() << " bars, "
                                  << core::format_date(request.bars.front().timestamp) << " to "
                                  << core::format_date(request.bars.back().timestamp) << ")");

    // Indicator series live for this run only
    IndicatorContext context(request.bars);
    auto prepared = context.prepare(request.strategy.referenced_indicators());
    if (prepared.is_error()) {
        return make_error<BacktestResult>(ErrorCode::ENGINE_FAILURE, prepared.error()->what(),
                                          "BacktestEngine");
    }

    StrategyPredicate predicate(request.strategy, context);
    SimulationEngine simulation(config_);
    auto trace = simulation.run(request.bars, request.strategy, predicate);
    if (trace.is_error()) {
        return make_error<BacktestResult>(ErrorCode::ENGINE_FAILURE, trace.error()->what(),
                                          "BacktestEngine");
    }

    BacktestResult result;
    result.symbol = request.symbol;
    result.asset_class = request.asset_class;
    result.timeframe = request.timeframe;
    result.strategy_name = request.strategy.name;
    result.start_date = request.bars.front().timestamp;
    result.end_date = request.bars.back().timestamp;

    metrics_calculator_.calculate_all_metrics(result, trace.value(), config_);

    for (const auto& trade : result.trades) {
        DEBUG("Trade " << core::format_date(trade.entry_time) << " -> "
                       << core::format_date(trade.exit_time) << " pnl " << trade.pnl << " ("
                       << exit_reason_to_string(trade.exit_reason) << ")");
    }

    INFO("Finished backtest of '" << result.strategy_name << "' on " << result.symbol
                                  << ": final value " << result.final_value << ", return "
                                  << result.total_return_pct << "%, " << result.total_trades
                                  << " trades");

    return Result<BacktestResult>(std::move(result));
}

}  // namespace backtest
}  // namespace stratlab
