// include/stratlab/data/market_data_provider.hpp
#pragma once

#include <string>
#include <vector>
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"
#include "stratlab/data/csv_price_loader.hpp"

namespace stratlab {

/**
 * @brief Identifies one historical series request
 */
struct MarketDataQuery {
    std::string symbol;
    AssetClass asset_class{AssetClass::STOCK};
    DataFrequency timeframe{DataFrequency::DAILY};
    Timestamp start;
    Timestamp end;

    /**
     * @brief Stable string form used as a cache key
     */
    std::string key() const;
};

/**
 * @brief Source of historical bars
 */
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    /**
     * @brief Fetch bars for a query, inclusive of both ends of the range
     * @return Bars in time order, or DATA_NOT_FOUND when none fall in range
     */
    virtual Result<std::vector<Bar>> fetch(const MarketDataQuery& query) = 0;
};

/**
 * @brief Provider over a directory of <SYMBOL>_<timeframe>.csv files
 */
class CsvMarketDataProvider : public MarketDataProvider {
public:
    CsvMarketDataProvider(std::string data_directory, CsvLoaderConfig config = CsvLoaderConfig());

    Result<std::vector<Bar>> fetch(const MarketDataQuery& query) override;

    std::string path_for(const MarketDataQuery& query) const;

private:
    std::string data_directory_;
    CsvPriceLoader loader_;
};

}  // namespace stratlab
