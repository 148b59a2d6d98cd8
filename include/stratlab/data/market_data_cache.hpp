// include/stratlab/data/market_data_cache.hpp
#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"
#include "stratlab/data/market_data_provider.hpp"

namespace stratlab {

/**
 * @brief Single-flight cache in front of a market data provider
 *
 * At most one fetch is in flight per query key; concurrent callers for the
 * same key wait on the same fetch and share its bars. Failed fetches are
 * dropped so the next caller retries.
 */
class MarketDataCache {
public:
    using BarsPtr = std::shared_ptr<const std::vector<Bar>>;

    explicit MarketDataCache(std::shared_ptr<MarketDataProvider> provider);

    /**
     * @brief Return cached bars, fetching them once if needed
     * @param query Series to fetch
     * @return Shared bars, or the provider's error
     */
    Result<BarsPtr> get(const MarketDataQuery& query);

    void clear();

    size_t hits() const;
    size_t misses() const;
    size_t size() const;

private:
    std::shared_ptr<MarketDataProvider> provider_;

    struct Entry {
        std::shared_future<BarsPtr> bars;
        uint64_t generation{0};  // Identifies the fetch that created the entry
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    uint64_t next_generation_{0};
    size_t hits_{0};
    size_t misses_{0};
};

}  // namespace stratlab
