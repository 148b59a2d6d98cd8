// include/stratlab/indicators/indicator_context.hpp
#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"
#include "stratlab/indicators/indicator_types.hpp"

namespace stratlab {

/**
 * @brief Indicator series computed for a single backtest run
 *
 * Built once before the simulation loop and read-only afterwards. Each
 * distinct series key is computed exactly once, however many rules use it.
 * Instances are owned by one run and never shared.
 */
class IndicatorContext {
public:
    explicit IndicatorContext(const std::vector<Bar>& bars);

    /**
     * @brief Compute every referenced series not already present
     * @param refs Indicator references used by the strategy
     * @return INVALID_ARGUMENT if a reference has bad parameters
     */
    Result<void> prepare(const std::vector<IndicatorRef>& refs);

    /**
     * @brief Look up a prepared series
     * @return nullptr if the series was never prepared
     */
    const IndicatorSeries* find(const IndicatorRef& ref) const;

    /**
     * @brief Value of a series at a bar index
     * @return std::nullopt when unprepared, out of range or inside the warm-up
     */
    std::optional<double> value(const IndicatorRef& ref, size_t index) const;

    size_t bar_count() const {
        return bars_.size();
    }

    size_t series_count() const {
        return series_.size();
    }

    const std::unordered_map<std::string, IndicatorSeries>& all_series() const {
        return series_;
    }

private:
    const std::vector<Bar>& bars_;
    std::unordered_map<std::string, IndicatorSeries> series_;
};

}  // namespace stratlab
