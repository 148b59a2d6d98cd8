// src/indicators/indicator_types.cpp

#include "stratlab/indicators/indicator_types.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace stratlab {

namespace {

// Shortest form of num_std that reads back as the same double, so 2.0 gives "2"
std::string format_number(double value) {
    std::string text;
    for (int precision = 6; precision <= std::numeric_limits<double>::max_digits10;
         ++precision) {
        std::ostringstream ss;
        ss << std::setprecision(precision) << value;
        text = ss.str();
        std::istringstream back(text);
        double parsed = 0.0;
        if (back >> parsed && parsed == value) {
            break;
        }
    }
    return text;
}

Result<void> check_period(int value, const std::string& name) {
    if (value < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                name + " must be a positive integer, got " + std::to_string(value),
                                "IndicatorRef");
    }
    if (value > MAX_INDICATOR_PERIOD) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                name + " must be at most " +
                                    std::to_string(MAX_INDICATOR_PERIOD) + ", got " +
                                    std::to_string(value),
                                "IndicatorRef");
    }
    return Result<void>();
}

bool output_allowed(IndicatorKind kind, IndicatorOutput output) {
    switch (kind) {
        case IndicatorKind::MACD:
            return output == IndicatorOutput::MACD_LINE || output == IndicatorOutput::MACD_SIGNAL ||
                   output == IndicatorOutput::MACD_HISTOGRAM;
        case IndicatorKind::BBANDS:
            return output == IndicatorOutput::BB_UPPER || output == IndicatorOutput::BB_MIDDLE ||
                   output == IndicatorOutput::BB_LOWER;
        case IndicatorKind::STOCHASTIC:
            return output == IndicatorOutput::STOCH_K || output == IndicatorOutput::STOCH_D;
        default:
            return output == IndicatorOutput::VALUE;
    }
}

}  // namespace

std::string IndicatorRef::series_key() const {
    switch (kind()) {
        case IndicatorKind::PRICE:
            return price_field_to_string(std::get<PriceParams>(params).field);
        case IndicatorKind::SMA:
            return "sma_" + std::to_string(std::get<SmaParams>(params).period);
        case IndicatorKind::EMA:
            return "ema_" + std::to_string(std::get<EmaParams>(params).period);
        case IndicatorKind::RSI:
            return "rsi_" + std::to_string(std::get<RsiParams>(params).period);
        case IndicatorKind::MACD: {
            const auto& p = std::get<MacdParams>(params);
            std::string prefix = "macd";
            if (output == IndicatorOutput::MACD_SIGNAL)
                prefix = "macds";
            else if (output == IndicatorOutput::MACD_HISTOGRAM)
                prefix = "macdh";
            return prefix + "_" + std::to_string(p.fast) + "_" + std::to_string(p.slow) + "_" +
                   std::to_string(p.signal);
        }
        case IndicatorKind::BBANDS: {
            const auto& p = std::get<BollingerParams>(params);
            std::string prefix = "bbm";
            if (output == IndicatorOutput::BB_UPPER)
                prefix = "bbu";
            else if (output == IndicatorOutput::BB_LOWER)
                prefix = "bbl";
            return prefix + "_" + std::to_string(p.period) + "_" + format_number(p.num_std);
        }
        case IndicatorKind::ATR:
            return "atr_" + std::to_string(std::get<AtrParams>(params).period);
        case IndicatorKind::STOCHASTIC: {
            const auto& p = std::get<StochasticParams>(params);
            std::string prefix = output == IndicatorOutput::STOCH_D ? "stochd" : "stochk";
            return prefix + "_" + std::to_string(p.period) + "_" + std::to_string(p.smooth);
        }
    }
    return "unknown";
}

int IndicatorRef::warmup_bars() const {
    switch (kind()) {
        case IndicatorKind::PRICE:
            return 0;
        case IndicatorKind::SMA:
            return std::get<SmaParams>(params).period - 1;
        case IndicatorKind::EMA:
            return std::get<EmaParams>(params).period - 1;
        case IndicatorKind::RSI:
            return std::get<RsiParams>(params).period;
        case IndicatorKind::MACD: {
            const auto& p = std::get<MacdParams>(params);
            int line = std::max(p.fast, p.slow) - 1;
            return output == IndicatorOutput::MACD_LINE ? line : line + p.signal - 1;
        }
        case IndicatorKind::BBANDS:
            return std::get<BollingerParams>(params).period - 1;
        case IndicatorKind::ATR:
            return std::get<AtrParams>(params).period;
        case IndicatorKind::STOCHASTIC: {
            const auto& p = std::get<StochasticParams>(params);
            int k = p.period - 1;
            return output == IndicatorOutput::STOCH_D ? k + p.smooth - 1 : k;
        }
    }
    return 0;
}

bool IndicatorRef::output_valid() const {
    return output_allowed(kind(), output);
}

Result<void> IndicatorRef::validate() const {
    if (!output_valid()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Output '" + indicator_output_to_string(output) +
                                    "' is not produced by indicator '" +
                                    indicator_kind_to_string(kind()) + "'",
                                "IndicatorRef");
    }

    switch (kind()) {
        case IndicatorKind::PRICE:
            return Result<void>();
        case IndicatorKind::SMA:
            return check_period(std::get<SmaParams>(params).period, "period");
        case IndicatorKind::EMA:
            return check_period(std::get<EmaParams>(params).period, "period");
        case IndicatorKind::RSI:
            return check_period(std::get<RsiParams>(params).period, "period");
        case IndicatorKind::MACD: {
            const auto& p = std::get<MacdParams>(params);
            auto fast = check_period(p.fast, "fast");
            if (fast.is_error())
                return fast;
            auto slow = check_period(p.slow, "slow");
            if (slow.is_error())
                return slow;
            return check_period(p.signal, "signal");
        }
        case IndicatorKind::BBANDS: {
            const auto& p = std::get<BollingerParams>(params);
            auto period = check_period(p.period, "period");
            if (period.is_error())
                return period;
            if (!std::isfinite(p.num_std) || p.num_std <= 0.0) {
                return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                        "num_std must be a positive number, got " +
                                            format_number(p.num_std),
                                        "IndicatorRef");
            }
            return Result<void>();
        }
        case IndicatorKind::ATR:
            return check_period(std::get<AtrParams>(params).period, "period");
        case IndicatorKind::STOCHASTIC: {
            const auto& p = std::get<StochasticParams>(params);
            auto period = check_period(p.period, "period");
            if (period.is_error())
                return period;
            return check_period(p.smooth, "smooth");
        }
    }
    return Result<void>();
}

IndicatorRef IndicatorRef::price(PriceField field) {
    return IndicatorRef{PriceParams{field}, IndicatorOutput::VALUE};
}

IndicatorRef IndicatorRef::sma(int period) {
    return IndicatorRef{SmaParams{period}, IndicatorOutput::VALUE};
}

IndicatorRef IndicatorRef::ema(int period) {
    return IndicatorRef{EmaParams{period}, IndicatorOutput::VALUE};
}

IndicatorRef IndicatorRef::rsi(int period) {
    return IndicatorRef{RsiParams{period}, IndicatorOutput::VALUE};
}

IndicatorRef IndicatorRef::macd(int fast, int slow, int signal, IndicatorOutput output) {
    return IndicatorRef{MacdParams{fast, slow, signal}, output};
}

IndicatorRef IndicatorRef::bollinger(int period, double num_std, IndicatorOutput output) {
    return IndicatorRef{BollingerParams{period, num_std}, output};
}

IndicatorRef IndicatorRef::atr(int period) {
    return IndicatorRef{AtrParams{period}, IndicatorOutput::VALUE};
}

IndicatorRef IndicatorRef::stochastic(int period, int smooth, IndicatorOutput output) {
    return IndicatorRef{StochasticParams{period, smooth}, output};
}

std::string indicator_kind_to_string(IndicatorKind kind) {
    switch (kind) {
        case IndicatorKind::PRICE:
            return "price";
        case IndicatorKind::SMA:
            return "sma";
        case IndicatorKind::EMA:
            return "ema";
        case IndicatorKind::RSI:
            return "rsi";
        case IndicatorKind::MACD:
            return "macd";
        case IndicatorKind::BBANDS:
            return "bbands";
        case IndicatorKind::ATR:
            return "atr";
        case IndicatorKind::STOCHASTIC:
            return "stochastic";
        default:
            return "unknown";
    }
}

std::optional<IndicatorKind> indicator_kind_from_string(const std::string& value) {
    if (value == "price")
        return IndicatorKind::PRICE;
    if (value == "sma")
        return IndicatorKind::SMA;
    if (value == "ema")
        return IndicatorKind::EMA;
    if (value == "rsi")
        return IndicatorKind::RSI;
    if (value == "macd")
        return IndicatorKind::MACD;
    if (value == "bbands" || value == "bollinger")
        return IndicatorKind::BBANDS;
    if (value == "atr")
        return IndicatorKind::ATR;
    if (value == "stochastic" || value == "stoch")
        return IndicatorKind::STOCHASTIC;
    return std::nullopt;
}

std::string indicator_output_to_string(IndicatorOutput output) {
    switch (output) {
        case IndicatorOutput::VALUE:
            return "value";
        case IndicatorOutput::MACD_LINE:
            return "macd";
        case IndicatorOutput::MACD_SIGNAL:
            return "signal";
        case IndicatorOutput::MACD_HISTOGRAM:
            return "histogram";
        case IndicatorOutput::BB_UPPER:
            return "upper";
        case IndicatorOutput::BB_MIDDLE:
            return "middle";
        case IndicatorOutput::BB_LOWER:
            return "lower";
        case IndicatorOutput::STOCH_K:
            return "k";
        case IndicatorOutput::STOCH_D:
            return "d";
        default:
            return "unknown";
    }
}

std::optional<IndicatorOutput> indicator_output_from_string(IndicatorKind kind,
                                                            const std::string& value) {
    std::optional<IndicatorOutput> output;
    if (value == "value")
        output = IndicatorOutput::VALUE;
    else if (value == "macd" || value == "line")
        output = IndicatorOutput::MACD_LINE;
    else if (value == "signal")
        output = IndicatorOutput::MACD_SIGNAL;
    else if (value == "histogram" || value == "hist")
        output = IndicatorOutput::MACD_HISTOGRAM;
    else if (value == "upper")
        output = IndicatorOutput::BB_UPPER;
    else if (value == "middle")
        output = IndicatorOutput::BB_MIDDLE;
    else if (value == "lower")
        output = IndicatorOutput::BB_LOWER;
    else if (value == "k" || value == "%k")
        output = IndicatorOutput::STOCH_K;
    else if (value == "d" || value == "%d")
        output = IndicatorOutput::STOCH_D;

    if (!output)
        return std::nullopt;
    if (*output == IndicatorOutput::VALUE)
        return default_output(kind);
    if (!output_allowed(kind, *output))
        return std::nullopt;
    return output;
}

std::string price_field_to_string(PriceField field) {
    switch (field) {
        case PriceField::OPEN:
            return "open";
        case PriceField::HIGH:
            return "high";
        case PriceField::LOW:
            return "low";
        case PriceField::CLOSE:
            return "close";
        case PriceField::VOLUME:
            return "volume";
        default:
            return "close";
    }
}

std::optional<PriceField> price_field_from_string(const std::string& value) {
    if (value == "open")
        return PriceField::OPEN;
    if (value == "high")
        return PriceField::HIGH;
    if (value == "low")
        return PriceField::LOW;
    if (value == "close")
        return PriceField::CLOSE;
    if (value == "volume")
        return PriceField::VOLUME;
    return std::nullopt;
}

IndicatorOutput default_output(IndicatorKind kind) {
    switch (kind) {
        case IndicatorKind::MACD:
            return IndicatorOutput::MACD_LINE;
        case IndicatorKind::BBANDS:
            return IndicatorOutput::BB_MIDDLE;
        case IndicatorKind::STOCHASTIC:
            return IndicatorOutput::STOCH_K;
        default:
            return IndicatorOutput::VALUE;
    }
}

}  // namespace stratlab
