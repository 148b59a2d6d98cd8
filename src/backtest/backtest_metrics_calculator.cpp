#include "stratlab/backtest/backtest_metrics_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace stratlab {

// ========== Return Calculations ==========

double BacktestMetricsCalculator::calculate_total_return(double start_value,
                                                         double end_value) const {
    return end_value - start_value;
}

double BacktestMetricsCalculator::calculate_total_return_pct(double start_value,
                                                             double end_value) const {
    if (start_value <= 0.0) {
        return 0.0;
    }
    return (end_value - start_value) / start_value * 100.0;
}

std::vector<double> BacktestMetricsCalculator::calculate_returns_from_equity(
    const backtest::EquityCurve& equity_curve) const {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }

    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        if (equity_curve[i - 1].second > 0.0) {
            double ret = (equity_curve[i].second - equity_curve[i - 1].second) /
                         equity_curve[i - 1].second;
            returns.push_back(ret);
        }
    }
    return returns;
}

// ========== Risk-Adjusted Return Metrics ==========

std::optional<double> BacktestMetricsCalculator::calculate_sharpe_ratio(
    const std::vector<double>& returns, int periods_per_year) const {
    if (returns.size() < 2 || periods_per_year <= 0) {
        return std::nullopt;
    }

    double mean_return = calculate_mean(returns);
    double std_dev = calculate_std_dev(returns, mean_return);

    // Flat equity curves leave the ratio undefined
    if (!(std_dev > 0.0) || !std::isfinite(std_dev)) {
        return std::nullopt;
    }

    return mean_return / std_dev * std::sqrt(static_cast<double>(periods_per_year));
}

// ========== Drawdown Metrics ==========

std::vector<std::pair<Timestamp, double>> BacktestMetricsCalculator::calculate_drawdowns(
    const backtest::EquityCurve& equity_curve) const {
    std::vector<std::pair<Timestamp, double>> drawdowns;
    drawdowns.reserve(equity_curve.size());

    double peak = 0.0;
    for (const auto& [timestamp, equity] : equity_curve) {
        peak = std::max(peak, equity);
        double drawdown = peak > 0.0 ? (peak - equity) / peak : 0.0;
        drawdowns.emplace_back(timestamp, drawdown);
    }
    return drawdowns;
}

BacktestMetricsCalculator::Drawdown BacktestMetricsCalculator::calculate_max_drawdown(
    const backtest::EquityCurve& equity_curve) const {
    Drawdown result;
    if (equity_curve.empty()) {
        return result;
    }

    double peak = equity_curve.front().second;
    for (const auto& point : equity_curve) {
        peak = std::max(peak, point.second);
        double decline = peak - point.second;
        if (decline > result.amount) {
            result.amount = decline;
            result.pct = peak > 0.0 ? decline / peak * 100.0 : 0.0;
        }
    }
    return result;
}

// ========== Trade Statistics ==========

BacktestMetricsCalculator::TradeStatistics BacktestMetricsCalculator::calculate_trade_statistics(
    const std::vector<backtest::Trade>& trades) const {
    TradeStatistics stats;
    stats.total_trades = static_cast<int>(trades.size());

    double signed_loss = 0.0;
    for (const auto& trade : trades) {
        stats.total_commission += trade.commission;
        if (trade.incomplete) {
            continue;
        }

        stats.completed_trades++;
        if (trade.pnl > 0.0) {
            stats.winning_trades++;
            stats.total_profit += trade.pnl;
        } else if (trade.pnl < 0.0) {
            stats.losing_trades++;
            signed_loss += trade.pnl;
        }
    }
    stats.total_loss = std::abs(signed_loss);

    if (stats.completed_trades > 0) {
        stats.win_rate = static_cast<double>(stats.winning_trades) / stats.completed_trades * 100.0;
    }
    if (stats.winning_trades > 0) {
        stats.avg_win = stats.total_profit / stats.winning_trades;
    }
    if (stats.losing_trades > 0) {
        stats.avg_loss = stats.total_loss / stats.losing_trades;
        stats.profit_factor = stats.total_profit / stats.total_loss;
    }
    return stats;
}

// ========== Composite Calculation ==========

void BacktestMetricsCalculator::calculate_all_metrics(backtest::BacktestResult& result,
                                                      const backtest::SimulationTrace& trace,
                                                      const backtest::BacktestConfig& config) const {
    result.initial_capital = config.initial_capital;
    result.final_value =
        trace.equity_curve.empty() ? config.initial_capital : trace.equity_curve.back().second;

    result.total_return = calculate_total_return(result.initial_capital, result.final_value);
    result.total_return_pct = calculate_total_return_pct(result.initial_capital, result.final_value);

    auto returns = calculate_returns_from_equity(trace.equity_curve);
    result.sharpe_ratio = calculate_sharpe_ratio(returns, config.trading_periods_per_year);

    auto drawdown = calculate_max_drawdown(trace.equity_curve);
    result.max_drawdown = drawdown.amount;
    result.max_drawdown_pct = drawdown.pct;

    auto stats = calculate_trade_statistics(trace.trades);
    result.total_trades = stats.total_trades;
    result.completed_trades = stats.completed_trades;
    result.winning_trades = stats.winning_trades;
    result.losing_trades = stats.losing_trades;
    result.win_rate = stats.win_rate;
    result.avg_win = stats.avg_win;
    result.avg_loss = stats.avg_loss;
    result.profit_factor = stats.profit_factor;
    result.total_commission = stats.total_commission;

    result.equity_curve = trace.equity_curve;
    result.trades = trace.trades;
}

// ========== Helper Methods ==========

double BacktestMetricsCalculator::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double BacktestMetricsCalculator::calculate_std_dev(const std::vector<double>& values,
                                                    double mean) const {
    if (values.size() < 2) {
        return 0.0;
    }

    double sq_sum = 0.0;
    for (double value : values) {
        double diff = value - mean;
        sq_sum += diff * diff;
    }
    return std::sqrt(sq_sum / (values.size() - 1));
}

}  // namespace stratlab
