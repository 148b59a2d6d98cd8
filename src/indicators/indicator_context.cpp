// src/indicators/indicator_context.cpp

#include "stratlab/indicators/indicator_context.hpp"
#include "stratlab/core/logger.hpp"
#include "stratlab/indicators/indicator_library.hpp"

namespace stratlab {

IndicatorContext::IndicatorContext(const std::vector<Bar>& bars) : bars_(bars) {}

Result<void> IndicatorContext::prepare(const std::vector<IndicatorRef>& refs) {
    for (const auto& ref : refs) {
        std::string key = ref.series_key();
        if (series_.count(key) > 0) {
            continue;
        }

        auto computed = IndicatorLibrary::compute(ref, bars_);
        if (computed.is_error()) {
            return make_error<void>(computed.error()->code(),
                                    "Failed to compute " + key + ": " + computed.error()->what(),
                                    "IndicatorContext");
        }

        DEBUG("Computed indicator series " << key << " over " << bars_.size() << " bars");
        series_.emplace(key, computed.take_value());
    }
    return Result<void>();
}

const IndicatorSeries* IndicatorContext::find(const IndicatorRef& ref) const {
    auto it = series_.find(ref.series_key());
    if (it == series_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<double> IndicatorContext::value(const IndicatorRef& ref, size_t index) const {
    const IndicatorSeries* series = find(ref);
    if (!series) {
        return std::nullopt;
    }
    return series->at(index);
}

}  // namespace stratlab
