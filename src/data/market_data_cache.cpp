// src/data/market_data_cache.cpp
#include "stratlab/data/market_data_cache.hpp"
#include <stdexcept>
#include "stratlab/core/logger.hpp"

namespace stratlab {

MarketDataCache::MarketDataCache(std::shared_ptr<MarketDataProvider> provider)
    : provider_(std::move(provider)) {
    if (!provider_) {
        throw std::invalid_argument("MarketDataCache requires a provider");
    }
}

Result<MarketDataCache::BarsPtr> MarketDataCache::get(const MarketDataQuery& query) {
    const std::string key = query.key();

    std::promise<BarsPtr> promise;
    std::shared_future<BarsPtr> future;
    uint64_t generation = 0;
    bool leader = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            future = it->second.bars;
            ++hits_;
        } else {
            future = promise.get_future().share();
            generation = ++next_generation_;
            entries_.emplace(key, Entry{future, generation});
            ++misses_;
            leader = true;
        }
    }

    if (leader) {
        DEBUG("Cache miss for " << key << ", fetching");
        std::unique_ptr<EngineError> failure;
        try {
            auto fetched = provider_->fetch(query);
            if (fetched.is_error()) {
                failure = std::make_unique<EngineError>(*fetched.error());
            } else {
                promise.set_value(std::make_shared<const std::vector<Bar>>(fetched.take_value()));
            }
        } catch (const std::exception& e) {
            failure = std::make_unique<EngineError>(ErrorCode::MARKET_DATA_ERROR,
                                                    std::string("Fetch failed: ") + e.what(),
                                                    "MarketDataCache");
        }

        if (failure) {
            {
                // A clear() during the fetch may have let a newer fetch take the key
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = entries_.find(key);
                if (it != entries_.end() && it->second.generation == generation) {
                    entries_.erase(it);
                }
            }
            WARN("Fetch for " << key << " failed: " << failure->what());
            promise.set_exception(std::make_exception_ptr(*failure));
        }
    }

    try {
        return Result<BarsPtr>(future.get());
    } catch (const EngineError& e) {
        return make_error<BarsPtr>(e.code(), e.what(), e.component());
    }
}

void MarketDataCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
}

size_t MarketDataCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

size_t MarketDataCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

size_t MarketDataCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace stratlab
