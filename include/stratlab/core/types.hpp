// include/stratlab/core/types.hpp

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace stratlab {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 * Used for all price-related calculations
 */
using Price = double;

/**
 * @brief Quantity type for position sizes
 * Double to support fractional units
 */
using Quantity = double;

/**
 * @brief Market data bar structure
 * Represents OHLCV data for any timeframe
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    std::string symbol;

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v, std::string s)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), symbol(std::move(s)) {}
};

/**
 * @brief Asset class enumeration
 * Informational only, echoed back in results
 */
enum class AssetClass { STOCK, CRYPTO, FOREX, OPTION, UNKNOWN };

/**
 * @brief Data frequency enumeration
 * Represents different timeframes for market data
 */
enum class DataFrequency {
    MONTHLY,    // 1mo
    WEEKLY,     // 1wk
    DAILY,      // 1d
    HOURLY,     // 1h
    MINUTE_15,  // 15m
    MINUTE_5,   // 5m
    MINUTE_1    // 1m
};

inline std::string asset_class_to_string(AssetClass asset_class) {
    switch (asset_class) {
        case AssetClass::STOCK:
            return "stock";
        case AssetClass::CRYPTO:
            return "crypto";
        case AssetClass::FOREX:
            return "forex";
        case AssetClass::OPTION:
            return "option";
        default:
            return "unknown";
    }
}

inline AssetClass asset_class_from_string(const std::string& value) {
    if (value == "stock")
        return AssetClass::STOCK;
    if (value == "crypto")
        return AssetClass::CRYPTO;
    if (value == "forex")
        return AssetClass::FOREX;
    if (value == "option")
        return AssetClass::OPTION;
    return AssetClass::UNKNOWN;
}

/**
 * @brief Convert DataFrequency to its timeframe label
 * @param freq The data frequency
 * @return Label such as "1d" or "15m"
 */
inline std::string frequency_to_string(DataFrequency freq) {
    switch (freq) {
        case DataFrequency::MONTHLY:
            return "1mo";
        case DataFrequency::WEEKLY:
            return "1wk";
        case DataFrequency::DAILY:
            return "1d";
        case DataFrequency::HOURLY:
            return "1h";
        case DataFrequency::MINUTE_15:
            return "15m";
        case DataFrequency::MINUTE_5:
            return "5m";
        case DataFrequency::MINUTE_1:
            return "1m";
        default:
            return "1d";
    }
}

/**
 * @brief Parse a timeframe label
 * @param label Label such as "1d"
 * @return Matching frequency, or nullopt for an unknown label
 */
inline std::optional<DataFrequency> frequency_from_string(const std::string& label) {
    if (label == "1mo")
        return DataFrequency::MONTHLY;
    if (label == "1wk")
        return DataFrequency::WEEKLY;
    if (label == "1d")
        return DataFrequency::DAILY;
    if (label == "1h")
        return DataFrequency::HOURLY;
    if (label == "15m")
        return DataFrequency::MINUTE_15;
    if (label == "5m")
        return DataFrequency::MINUTE_5;
    if (label == "1m")
        return DataFrequency::MINUTE_1;
    return std::nullopt;
}

}  // namespace stratlab
