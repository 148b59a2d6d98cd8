// include/stratlab/indicators/indicator_library.hpp
#pragma once

#include <vector>
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"
#include "stratlab/indicators/indicator_types.hpp"

namespace stratlab {

/**
 * @brief Stateless technical indicator calculations
 *
 * Every output has exactly one entry per input bar. Entries inside the
 * warm-up window are std::nullopt, never zero. Inputs shorter than the
 * warm-up give an all-unavailable series rather than an error.
 */
class IndicatorLibrary {
public:
    /**
     * @brief Compute the series an indicator reference points at
     * @param ref Indicator kind, parameters and output line
     * @param bars Price series in time order
     * @return Series named by ref.series_key(), or INVALID_ARGUMENT for bad parameters
     */
    static Result<IndicatorSeries> compute(const IndicatorRef& ref, const std::vector<Bar>& bars);

    static IndicatorValues price(const std::vector<Bar>& bars, PriceField field);

    static IndicatorValues sma(const std::vector<double>& values, int period);

    /**
     * @brief Exponential moving average seeded with the SMA of the first window
     * alpha = 2 / (period + 1); the first value sits at index period - 1
     */
    static IndicatorValues ema(const std::vector<double>& values, int period);

    /**
     * @brief Relative strength index with Wilder smoothing
     * First value at index period. 100 when the average loss is zero.
     */
    static IndicatorValues rsi(const std::vector<double>& closes, int period);

    struct MacdLines {
        IndicatorValues line;
        IndicatorValues signal;
        IndicatorValues histogram;
    };

    static MacdLines macd(const std::vector<double>& closes, int fast, int slow, int signal);

    struct BollingerBands {
        IndicatorValues upper;
        IndicatorValues middle;
        IndicatorValues lower;
    };

    /**
     * @brief Bollinger bands using the population standard deviation of the window
     */
    static BollingerBands bollinger(const std::vector<double>& closes, int period, double num_std);

    static IndicatorValues true_range(const std::vector<Bar>& bars);

    /**
     * @brief Average true range
     * True range starts at index 1, so the first ATR (mean of TR[1..period])
     * sits at index period and later values use Wilder smoothing.
     */
    static IndicatorValues atr(const std::vector<Bar>& bars, int period);

    struct StochasticLines {
        IndicatorValues k;
        IndicatorValues d;
    };

    /**
     * @brief Stochastic oscillator
     * %K is unavailable where the highest high equals the lowest low. %D is
     * the SMA of %K over smooth bars and requires every %K in its window.
     */
    static StochasticLines stochastic(const std::vector<Bar>& bars, int period, int smooth);

    static std::vector<double> closes(const std::vector<Bar>& bars);

private:
    // Moving average over a partially available input, only where the full window is present
    static IndicatorValues sma_of_available(const IndicatorValues& values, int period);

    // EMA over a series whose leading entries may be unavailable
    static IndicatorValues ema_of_available(const IndicatorValues& values, int period);
};

}  // namespace stratlab
