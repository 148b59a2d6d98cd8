// include/stratlab/indicators/indicator_types.hpp
#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "stratlab/core/error.hpp"

namespace stratlab {

/**
 * @brief Indicator kinds understood by the library
 *
 * The order matches the alternatives of IndicatorParams so that
 * kind() can be derived from the variant index.
 */
enum class IndicatorKind { PRICE, SMA, EMA, RSI, MACD, BBANDS, ATR, STOCHASTIC };

enum class PriceField { OPEN, HIGH, LOW, CLOSE, VOLUME };

// Upper bound on any period or smoothing length, keeps warm-up sums inside int
constexpr int MAX_INDICATOR_PERIOD = 1000000;

/**
 * @brief Which line of a multi-output indicator a reference reads
 *
 * Single-output kinds only accept VALUE.
 */
enum class IndicatorOutput {
    VALUE,
    MACD_LINE,
    MACD_SIGNAL,
    MACD_HISTOGRAM,
    BB_UPPER,
    BB_MIDDLE,
    BB_LOWER,
    STOCH_K,
    STOCH_D
};

struct PriceParams {
    PriceField field{PriceField::CLOSE};
};

struct SmaParams {
    int period{20};
};

struct EmaParams {
    int period{20};
};

struct RsiParams {
    int period{14};
};

struct MacdParams {
    int fast{12};
    int slow{26};
    int signal{9};
};

struct BollingerParams {
    int period{20};
    double num_std{2.0};
};

struct AtrParams {
    int period{14};
};

struct StochasticParams {
    int period{14};
    int smooth{3};
};

using IndicatorParams = std::variant<PriceParams, SmaParams, EmaParams, RsiParams, MacdParams,
                                     BollingerParams, AtrParams, StochasticParams>;

/**
 * @brief Values of one indicator line, aligned index-for-index with the bars
 * std::nullopt marks positions that cannot be computed yet
 */
using IndicatorValues = std::vector<std::optional<double>>;

/**
 * @brief Reference to one output line of a parameterized indicator
 */
struct IndicatorRef {
    IndicatorParams params{PriceParams{}};
    IndicatorOutput output{IndicatorOutput::VALUE};

    IndicatorKind kind() const {
        return static_cast<IndicatorKind>(params.index());
    }

    /**
     * @brief Identifier derived from the kind, every parameter and the output line
     *
     * Two references share a key iff they read the same series, e.g.
     * "macd_12_26_9", "macds_5_35_5", "bbl_20_2", "stochd_14_3".
     */
    std::string series_key() const;

    /**
     * @brief Number of leading bars for which the series is unavailable
     */
    int warmup_bars() const;

    /**
     * @brief Check parameters and output selector
     * @return INVALID_ARGUMENT naming the offending parameter
     */
    Result<void> validate() const;

    /**
     * @brief Whether the output selector is produced by this kind
     */
    bool output_valid() const;

    static IndicatorRef price(PriceField field = PriceField::CLOSE);
    static IndicatorRef sma(int period);
    static IndicatorRef ema(int period);
    static IndicatorRef rsi(int period);
    static IndicatorRef macd(int fast, int slow, int signal,
                             IndicatorOutput output = IndicatorOutput::MACD_LINE);
    static IndicatorRef bollinger(int period, double num_std,
                                  IndicatorOutput output = IndicatorOutput::BB_MIDDLE);
    static IndicatorRef atr(int period);
    static IndicatorRef stochastic(int period, int smooth,
                                   IndicatorOutput output = IndicatorOutput::STOCH_K);
};

/**
 * @brief A computed indicator line
 */
struct IndicatorSeries {
    std::string name;
    IndicatorValues values;

    size_t size() const {
        return values.size();
    }

    bool available(size_t index) const {
        return index < values.size() && values[index].has_value();
    }

    std::optional<double> at(size_t index) const {
        if (index >= values.size()) {
            return std::nullopt;
        }
        return values[index];
    }
};

std::string indicator_kind_to_string(IndicatorKind kind);
std::optional<IndicatorKind> indicator_kind_from_string(const std::string& value);

std::string indicator_output_to_string(IndicatorOutput output);
std::optional<IndicatorOutput> indicator_output_from_string(IndicatorKind kind,
                                                            const std::string& value);

std::string price_field_to_string(PriceField field);
std::optional<PriceField> price_field_from_string(const std::string& value);

/**
 * @brief Output line used when a rule names a kind without choosing one
 */
IndicatorOutput default_output(IndicatorKind kind);

}  // namespace stratlab
