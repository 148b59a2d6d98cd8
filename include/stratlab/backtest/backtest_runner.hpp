// include/stratlab/backtest/backtest_runner.hpp
#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "stratlab/backtest/backtest_types.hpp"
#include "stratlab/core/error.hpp"

namespace stratlab {
namespace backtest {

/**
 * @brief Outcome of one request submitted to the runner
 */
struct RunOutcome {
    std::string symbol;
    std::string strategy_name;
    Result<BacktestResult> result;

    RunOutcome(std::string sym, std::string name, Result<BacktestResult> res)
        : symbol(std::move(sym)), strategy_name(std::move(name)), result(std::move(res)) {}
};

/**
 * @brief Runs independent backtests concurrently
 *
 * Every request gets its own worker thread and its own engine, so runs share
 * no mutable state. A run that misses the deadline is reported as
 * TIMEOUT_ERROR and its eventual result is discarded. The runner keeps
 * such workers and joins them when it is destroyed, so no worker outlives it.
 */
class BacktestRunner {
public:
    explicit BacktestRunner(BacktestConfig config);
    ~BacktestRunner();

    BacktestRunner(const BacktestRunner&) = delete;
    BacktestRunner& operator=(const BacktestRunner&) = delete;

    /**
     * @brief Run every request and collect the outcomes in request order
     * @param requests Requests to run; each is copied into its worker
     * @param timeout Deadline measured from submission, shared by all runs
     */
    std::vector<RunOutcome> run_all(const std::vector<BacktestRequest>& requests,
                                    std::chrono::milliseconds timeout) const;

    /**
     * @brief Run a single request with a deadline
     */
    Result<BacktestResult> run_one(const BacktestRequest& request,
                                   std::chrono::milliseconds timeout) const;

    /**
     * @brief Workers that missed their deadline and are waiting to be joined
     */
    size_t abandoned_workers() const;

private:
    BacktestConfig config_;
    mutable std::mutex workers_mutex_;
    mutable std::vector<std::thread> abandoned_;
};

}  // namespace backtest
}  // namespace stratlab
