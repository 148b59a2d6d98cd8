// src/backtest/backtest_runner.cpp

#include "stratlab/backtest/backtest_runner.hpp"
#include <future>
#include <memory>
#include <system_error>
#include <thread>
#include "stratlab/backtest/backtest_engine.hpp"
#include "stratlab/core/logger.hpp"

namespace stratlab {
namespace backtest {

namespace {

using RunPromise = std::promise<Result<BacktestResult>>;

struct LaunchedRun {
    std::future<Result<BacktestResult>> future;
    std::thread worker;
};

LaunchedRun launch(const BacktestConfig& config, const BacktestRequest& request) {
    auto promise = std::make_shared<RunPromise>();
    LaunchedRun run;
    run.future = promise->get_future();
    auto owned_request = std::make_shared<BacktestRequest>(request);

    try {
        run.worker = std::thread([config, owned_request, promise]() {
            Logger::register_component("BacktestRunner");
            BacktestEngine engine(config);
            try {
                promise->set_value(engine.run(*owned_request));
            } catch (const std::exception& e) {
                promise->set_value(make_error<BacktestResult>(
                    ErrorCode::ENGINE_FAILURE, std::string("Worker failed: ") + e.what(),
                    "BacktestRunner"));
            }
        });
    } catch (const std::system_error& e) {
        promise->set_value(make_error<BacktestResult>(
            ErrorCode::ENGINE_FAILURE, std::string("Could not start worker: ") + e.what(),
            "BacktestRunner"));
    }
    return run;
}

}  // namespace

BacktestRunner::BacktestRunner(BacktestConfig config) : config_(std::move(config)) {}

BacktestRunner::~BacktestRunner() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    if (!abandoned_.empty()) {
        INFO("Waiting for " << abandoned_.size() << " abandoned backtest workers");
    }
    for (auto& worker : abandoned_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t BacktestRunner::abandoned_workers() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return abandoned_.size();
}

std::vector<RunOutcome> BacktestRunner::run_all(const std::vector<BacktestRequest>& requests,
                                                std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::vector<LaunchedRun> runs;
    runs.reserve(requests.size());
    for (const auto& request : requests) {
        runs.push_back(launch(config_, request));
    }

    std::vector<RunOutcome> outcomes;
    outcomes.reserve(requests.size());
    for (size_t i = 0; i < requests.size(); ++i) {
        const auto& request = requests[i];
        auto& run = runs[i];
        if (run.future.wait_until(deadline) != std::future_status::ready) {
            WARN("Backtest of '" << request.strategy.name << "' on " << request.symbol
                                 << " exceeded " << timeout.count() << "ms and was abandoned");
            outcomes.emplace_back(request.symbol, request.strategy.name,
                                  make_error<BacktestResult>(
                                      ErrorCode::TIMEOUT_ERROR,
                                      "Backtest exceeded " + std::to_string(timeout.count()) +
                                          "ms",
                                      "BacktestRunner"));
            std::lock_guard<std::mutex> lock(workers_mutex_);
            abandoned_.push_back(std::move(run.worker));
            continue;
        }
        outcomes.emplace_back(request.symbol, request.strategy.name, run.future.get());
        if (run.worker.joinable()) {
            run.worker.join();
        }
    }
    return outcomes;
}

Result<BacktestResult> BacktestRunner::run_one(const BacktestRequest& request,
                                               std::chrono::milliseconds timeout) const {
    auto outcomes = run_all({request}, timeout);
    return std::move(outcomes.front().result);
}

}  // namespace backtest
}  // namespace stratlab
