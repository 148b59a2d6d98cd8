#include <filesystem>
#include <iomanip>
#include <iostream>
#include "stratlab/backtest/backtest_app_config.hpp"
#include "stratlab/backtest/backtest_csv_exporter.hpp"
#include "stratlab/backtest/backtest_runner.hpp"
#include "stratlab/core/logger.hpp"
#include "stratlab/core/time_utils.hpp"
#include "stratlab/data/market_data_cache.hpp"
#include "stratlab/strategy/strategy_parser.hpp"

using namespace stratlab;
using namespace stratlab::backtest;

namespace {

// Open-ended ranges cover every bar up to 2100-01-01
constexpr int64_t OPEN_END_SECONDS = 4102444800;

Result<Timestamp> parse_bound(const std::string& text, Timestamp fallback) {
    if (text.empty()) {
        return Result<Timestamp>(fallback);
    }
    return core::parse_timestamp(text);
}

Result<StrategyDefinition> resolve_strategy(const nlohmann::json& strategy,
                                            const std::filesystem::path& config_dir) {
    if (strategy.is_string()) {
        std::filesystem::path path = strategy.get<std::string>();
        if (path.is_relative()) {
            path = config_dir / path;
        }
        return StrategyParser::load_from_file(path.string());
    }
    return StrategyParser::from_json(strategy);
}

void print_summary(const BacktestResult& result) {
    auto optional_str = [](const std::optional<double>& value) {
        if (!value) {
            return std::string("n/a");
        }
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << *value;
        return ss.str();
    };

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "======= " << result.strategy_name << " on " << result.symbol << " ("
              << frequency_to_string(result.timeframe) << ") =======" << std::endl;
    std::cout << "Period:            " << core::format_date(result.start_date) << " to "
              << core::format_date(result.end_date) << std::endl;
    std::cout << "Initial capital:   " << result.initial_capital << std::endl;
    std::cout << "Final value:       " << result.final_value << std::endl;
    std::cout << "Total return:      " << result.total_return << " (" << result.total_return_pct
              << "%)" << std::endl;
    std::cout << "Sharpe ratio:      " << optional_str(result.sharpe_ratio) << std::endl;
    std::cout << "Max drawdown:      " << result.max_drawdown << " (" << result.max_drawdown_pct
              << "%)" << std::endl;
    std::cout << "Trades:            " << result.total_trades << " (" << result.completed_trades
              << " completed, " << result.winning_trades << " won, " << result.losing_trades
              << " lost)" << std::endl;
    std::cout << "Win rate:          " << result.win_rate << "%" << std::endl;
    std::cout << "Avg win / loss:    " << result.avg_win << " / " << result.avg_loss << std::endl;
    std::cout << "Profit factor:     " << optional_str(result.profit_factor) << std::endl;
    std::cout << "Commission paid:   " << result.total_commission << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <config.json>" << std::endl;
        return 2;
    }

    try {
        BacktestAppConfig config;
        auto loaded = config.load_from_file(argv[1]);
        if (loaded.is_error()) {
            std::cerr << "Failed to load config: " << loaded.error()->to_string() << std::endl;
            return 1;
        }

        auto& logger = Logger::instance();
        logger.initialize(config.logger);
        Logger::register_component("bt_strategy");
        INFO("Logger initialized for strategy backtest");

        auto config_dir = std::filesystem::absolute(argv[1]).parent_path();
        auto strategy = resolve_strategy(config.strategy, config_dir);
        if (strategy.is_error()) {
            ERROR("Invalid strategy: " << strategy.error()->to_string());
            std::cerr << "Invalid strategy: " << strategy.error()->what() << std::endl;
            return 1;
        }

        auto start = parse_bound(config.start_date, Timestamp(std::chrono::seconds(0)));
        auto end = parse_bound(config.end_date, Timestamp(std::chrono::seconds(OPEN_END_SECONDS)));
        if (start.is_error() || end.is_error()) {
            std::cerr << "Invalid date range in config" << std::endl;
            return 1;
        }

        auto provider = std::make_shared<CsvMarketDataProvider>(config.data_directory, config.csv);
        MarketDataCache cache(provider);

        std::vector<BacktestRequest> requests;
        for (const auto& symbol : config.symbols) {
            MarketDataQuery query{symbol, config.asset_class, config.timeframe, start.value(),
                                  end.value()};
            auto bars = cache.get(query);
            if (bars.is_error()) {
                ERROR("Skipping " << symbol << ": " << bars.error()->to_string());
                continue;
            }

            BacktestRequest request;
            request.symbol = symbol;
            request.asset_class = config.asset_class;
            request.timeframe = config.timeframe;
            request.bars = *bars.value();
            request.strategy = strategy.value();
            requests.push_back(std::move(request));
        }

        if (requests.empty()) {
            std::cerr << "No market data could be loaded" << std::endl;
            return 1;
        }

        BacktestRunner runner(config.engine);
        auto outcomes = runner.run_all(requests, std::chrono::seconds(config.timeout_seconds));

        int failures = 0;
        for (auto& outcome : outcomes) {
            if (outcome.result.is_error()) {
                ++failures;
                ERROR("Backtest of " << outcome.symbol << " failed: "
                                     << outcome.result.error()->to_string());
                std::cerr << outcome.symbol << ": " << outcome.result.error()->what() << std::endl;
                continue;
            }

            const auto& result = outcome.result.value();
            print_summary(result);

            auto output_dir = std::filesystem::path(config.output_directory) / outcome.symbol;
            BacktestCSVExporter exporter(output_dir.string());
            auto exported = exporter.export_result(result);
            if (exported.is_error()) {
                ++failures;
                ERROR("Export failed for " << outcome.symbol << ": "
                                           << exported.error()->to_string());
            }
        }

        INFO("Completed " << outcomes.size() << " backtests with " << failures << " failures");
        return failures == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
