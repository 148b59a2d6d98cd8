// src/data/market_data_provider.cpp
#include "stratlab/data/market_data_provider.hpp"
#include <filesystem>
#include "stratlab/core/logger.hpp"
#include "stratlab/core/time_utils.hpp"

namespace stratlab {

std::string MarketDataQuery::key() const {
    return symbol + "|" + asset_class_to_string(asset_class) + "|" +
           frequency_to_string(timeframe) + "|" + core::format_timestamp(start) + "|" +
           core::format_timestamp(end);
}

CsvMarketDataProvider::CsvMarketDataProvider(std::string data_directory, CsvLoaderConfig config)
    : data_directory_(std::move(data_directory)), loader_(std::move(config)) {}

std::string CsvMarketDataProvider::path_for(const MarketDataQuery& query) const {
    return (std::filesystem::path(data_directory_) /
            (query.symbol + "_" + frequency_to_string(query.timeframe) + ".csv"))
        .string();
}

Result<std::vector<Bar>> CsvMarketDataProvider::fetch(const MarketDataQuery& query) {
    if (query.end < query.start) {
        return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT,
                                            "End date precedes start date for " + query.symbol,
                                            "CsvMarketDataProvider");
    }

    auto loaded = loader_.load(path_for(query), query.symbol);
    if (loaded.is_error()) {
        return forward_error<std::vector<Bar>>(*loaded.error());
    }

    std::vector<Bar> bars;
    for (auto& bar : loaded.take_value()) {
        if (bar.timestamp >= query.start && bar.timestamp <= query.end) {
            bars.push_back(std::move(bar));
        }
    }

    if (bars.empty()) {
        return make_error<std::vector<Bar>>(ErrorCode::DATA_NOT_FOUND,
                                            "No data for " + query.symbol + " between " +
                                                core::format_date(query.start) + " and " +
                                                core::format_date(query.end),
                                            "CsvMarketDataProvider");
    }

    INFO("Fetched " << bars.size() << " " << frequency_to_string(query.timeframe) << " bars for "
                    << query.symbol);
    return Result<std::vector<Bar>>(std::move(bars));
}

}  // namespace stratlab
