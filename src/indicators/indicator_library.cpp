// src/indicators/indicator_library.cpp

#include "stratlab/indicators/indicator_library.hpp"
#include <algorithm>
#include <cmath>

namespace stratlab {

std::vector<double> IndicatorLibrary::closes(const std::vector<Bar>& bars) {
    std::vector<double> result;
    result.reserve(bars.size());
    for (const auto& bar : bars) {
        result.push_back(bar.close);
    }
    return result;
}

IndicatorValues IndicatorLibrary::price(const std::vector<Bar>& bars, PriceField field) {
    IndicatorValues result;
    result.reserve(bars.size());
    for (const auto& bar : bars) {
        switch (field) {
            case PriceField::OPEN:
                result.emplace_back(bar.open);
                break;
            case PriceField::HIGH:
                result.emplace_back(bar.high);
                break;
            case PriceField::LOW:
                result.emplace_back(bar.low);
                break;
            case PriceField::VOLUME:
                result.emplace_back(bar.volume);
                break;
            case PriceField::CLOSE:
            default:
                result.emplace_back(bar.close);
                break;
        }
    }
    return result;
}

IndicatorValues IndicatorLibrary::sma(const std::vector<double>& values, int period) {
    return sma_of_available(IndicatorValues(values.begin(), values.end()), period);
}

IndicatorValues IndicatorLibrary::ema(const std::vector<double>& values, int period) {
    return ema_of_available(IndicatorValues(values.begin(), values.end()), period);
}

IndicatorValues IndicatorLibrary::sma_of_available(const IndicatorValues& values, int period) {
    IndicatorValues result(values.size());
    if (period <= 0) {
        return result;
    }

    const size_t window = static_cast<size_t>(period);
    double sum = 0.0;
    size_t run = 0;  // consecutive available values ending at i

    for (size_t i = 0; i < values.size(); ++i) {
        if (!values[i]) {
            sum = 0.0;
            run = 0;
            continue;
        }
        sum += *values[i];
        ++run;
        if (run > window) {
            sum -= *values[i - window];
            run = window;
        }
        if (run == window) {
            result[i] = sum / period;
        }
    }
    return result;
}

IndicatorValues IndicatorLibrary::ema_of_available(const IndicatorValues& values, int period) {
    IndicatorValues result(values.size());
    if (period <= 0) {
        return result;
    }

    auto first = std::find_if(values.begin(), values.end(),
                              [](const std::optional<double>& v) { return v.has_value(); });
    if (first == values.end()) {
        return result;
    }

    const size_t start = static_cast<size_t>(std::distance(values.begin(), first));
    const size_t seed_index = start + static_cast<size_t>(period) - 1;
    if (seed_index >= values.size()) {
        return result;
    }

    double seed = 0.0;
    for (size_t i = start; i <= seed_index; ++i) {
        if (!values[i]) {
            return result;
        }
        seed += *values[i];
    }

    const double alpha = 2.0 / (period + 1);
    double prev = seed / period;
    result[seed_index] = prev;

    for (size_t i = seed_index + 1; i < values.size(); ++i) {
        if (!values[i]) {
            break;
        }
        prev = alpha * *values[i] + (1.0 - alpha) * prev;
        result[i] = prev;
    }
    return result;
}

IndicatorValues IndicatorLibrary::rsi(const std::vector<double>& closes, int period) {
    IndicatorValues result(closes.size());
    if (period <= 0 || closes.size() <= static_cast<size_t>(period)) {
        return result;
    }

    auto to_rsi = [](double avg_gain, double avg_loss) {
        if (avg_loss == 0.0) {
            return 100.0;
        }
        double rs = avg_gain / avg_loss;
        return 100.0 - 100.0 / (1.0 + rs);
    };

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (size_t i = 1; i <= static_cast<size_t>(period); ++i) {
        double change = closes[i] - closes[i - 1];
        if (change > 0.0) {
            avg_gain += change;
        } else {
            avg_loss -= change;
        }
    }
    avg_gain /= period;
    avg_loss /= period;
    result[period] = to_rsi(avg_gain, avg_loss);

    for (size_t i = static_cast<size_t>(period) + 1; i < closes.size(); ++i) {
        double change = closes[i] - closes[i - 1];
        double gain = change > 0.0 ? change : 0.0;
        double loss = change < 0.0 ? -change : 0.0;
        avg_gain = (avg_gain * (period - 1) + gain) / period;
        avg_loss = (avg_loss * (period - 1) + loss) / period;
        result[i] = to_rsi(avg_gain, avg_loss);
    }
    return result;
}

IndicatorLibrary::MacdLines IndicatorLibrary::macd(const std::vector<double>& closes, int fast,
                                                   int slow, int signal) {
    MacdLines lines;
    auto fast_ema = ema(closes, fast);
    auto slow_ema = ema(closes, slow);

    lines.line.resize(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        if (fast_ema[i] && slow_ema[i]) {
            lines.line[i] = *fast_ema[i] - *slow_ema[i];
        }
    }

    lines.signal = ema_of_available(lines.line, signal);

    lines.histogram.resize(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        if (lines.line[i] && lines.signal[i]) {
            lines.histogram[i] = *lines.line[i] - *lines.signal[i];
        }
    }
    return lines;
}

IndicatorLibrary::BollingerBands IndicatorLibrary::bollinger(const std::vector<double>& closes,
                                                             int period, double num_std) {
    BollingerBands bands;
    bands.middle = sma(closes, period);
    bands.upper.resize(closes.size());
    bands.lower.resize(closes.size());

    for (size_t i = 0; i < closes.size(); ++i) {
        if (!bands.middle[i]) {
            continue;
        }
        const double mean = *bands.middle[i];
        double sum_sq = 0.0;
        for (size_t j = i + 1 - static_cast<size_t>(period); j <= i; ++j) {
            double diff = closes[j] - mean;
            sum_sq += diff * diff;
        }
        const double stddev = std::sqrt(sum_sq / period);
        bands.upper[i] = mean + num_std * stddev;
        bands.lower[i] = mean - num_std * stddev;
    }
    return bands;
}

IndicatorValues IndicatorLibrary::true_range(const std::vector<Bar>& bars) {
    IndicatorValues result(bars.size());
    for (size_t i = 1; i < bars.size(); ++i) {
        const double prev_close = bars[i - 1].close;
        result[i] = std::max({bars[i].high - bars[i].low, std::abs(bars[i].high - prev_close),
                              std::abs(bars[i].low - prev_close)});
    }
    return result;
}

IndicatorValues IndicatorLibrary::atr(const std::vector<Bar>& bars, int period) {
    IndicatorValues result(bars.size());
    if (period <= 0 || bars.size() <= static_cast<size_t>(period)) {
        return result;
    }

    auto tr = true_range(bars);
    double sum = 0.0;
    for (size_t i = 1; i <= static_cast<size_t>(period); ++i) {
        sum += *tr[i];
    }
    double prev = sum / period;
    result[period] = prev;

    for (size_t i = static_cast<size_t>(period) + 1; i < bars.size(); ++i) {
        prev = (prev * (period - 1) + *tr[i]) / period;
        result[i] = prev;
    }
    return result;
}

IndicatorLibrary::StochasticLines IndicatorLibrary::stochastic(const std::vector<Bar>& bars,
                                                               int period, int smooth) {
    StochasticLines lines;
    lines.k.resize(bars.size());
    if (period > 0) {
        const size_t window = static_cast<size_t>(period);
        for (size_t i = window - 1; i < bars.size(); ++i) {
            double highest = bars[i].high;
            double lowest = bars[i].low;
            for (size_t j = i + 1 - window; j <= i; ++j) {
                highest = std::max(highest, bars[j].high);
                lowest = std::min(lowest, bars[j].low);
            }
            if (highest == lowest) {
                continue;
            }
            lines.k[i] = 100.0 * (bars[i].close - lowest) / (highest - lowest);
        }
    }
    lines.d = sma_of_available(lines.k, smooth);
    return lines;
}

Result<IndicatorSeries> IndicatorLibrary::compute(const IndicatorRef& ref,
                                                  const std::vector<Bar>& bars) {
    auto valid = ref.validate();
    if (valid.is_error()) {
        return forward_error<IndicatorSeries>(*valid.error());
    }

    IndicatorSeries series;
    series.name = ref.series_key();

    switch (ref.kind()) {
        case IndicatorKind::PRICE:
            series.values = price(bars, std::get<PriceParams>(ref.params).field);
            break;
        case IndicatorKind::SMA:
            series.values = sma(closes(bars), std::get<SmaParams>(ref.params).period);
            break;
        case IndicatorKind::EMA:
            series.values = ema(closes(bars), std::get<EmaParams>(ref.params).period);
            break;
        case IndicatorKind::RSI:
            series.values = rsi(closes(bars), std::get<RsiParams>(ref.params).period);
            break;
        case IndicatorKind::MACD: {
            const auto& p = std::get<MacdParams>(ref.params);
            auto lines = macd(closes(bars), p.fast, p.slow, p.signal);
            if (ref.output == IndicatorOutput::MACD_SIGNAL) {
                series.values = std::move(lines.signal);
            } else if (ref.output == IndicatorOutput::MACD_HISTOGRAM) {
                series.values = std::move(lines.histogram);
            } else {
                series.values = std::move(lines.line);
            }
            break;
        }
        case IndicatorKind::BBANDS: {
            const auto& p = std::get<BollingerParams>(ref.params);
            auto bands = bollinger(closes(bars), p.period, p.num_std);
            if (ref.output == IndicatorOutput::BB_UPPER) {
                series.values = std::move(bands.upper);
            } else if (ref.output == IndicatorOutput::BB_LOWER) {
                series.values = std::move(bands.lower);
            } else {
                series.values = std::move(bands.middle);
            }
            break;
        }
        case IndicatorKind::ATR:
            series.values = atr(bars, std::get<AtrParams>(ref.params).period);
            break;
        case IndicatorKind::STOCHASTIC: {
            const auto& p = std::get<StochasticParams>(ref.params);
            auto lines = stochastic(bars, p.period, p.smooth);
            series.values =
                ref.output == IndicatorOutput::STOCH_D ? std::move(lines.d) : std::move(lines.k);
            break;
        }
    }

    return Result<IndicatorSeries>(std::move(series));
}

}  // namespace stratlab
