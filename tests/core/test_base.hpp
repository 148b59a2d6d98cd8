//===== test_base.hpp =====
#pragma once

#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>
#include "stratlab/core/logger.hpp"
#include "stratlab/core/types.hpp"

namespace stratlab {
namespace testing {

class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.min_level = LogLevel::ERR;
        config.destination = LogDestination::CONSOLE;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }
};

// 2024-01-01T00:00:00Z
inline Timestamp day(int offset) {
    return Timestamp(std::chrono::seconds(1704067200)) + std::chrono::hours(24 * offset);
}

/**
 * @brief Daily bars where open/high/low sit around the close
 */
inline std::vector<Bar> make_bars(const std::vector<double>& closes,
                                  const std::string& symbol = "TEST") {
    std::vector<Bar> bars;
    bars.reserve(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        double close = closes[i];
        bars.emplace_back(day(static_cast<int>(i)), close, close + 1.0, close - 1.0, close,
                          1000.0, symbol);
    }
    return bars;
}

inline std::vector<Bar> make_ohlc_bars(const std::vector<double>& highs,
                                       const std::vector<double>& lows,
                                       const std::vector<double>& closes) {
    std::vector<Bar> bars;
    for (size_t i = 0; i < closes.size(); ++i) {
        bars.emplace_back(day(static_cast<int>(i)), closes[i], highs[i], lows[i], closes[i],
                          1000.0, "TEST");
    }
    return bars;
}

inline std::vector<double> linear_closes(size_t count, double start, double step) {
    std::vector<double> closes;
    closes.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        closes.push_back(start + step * static_cast<double>(i));
    }
    return closes;
}

}  // namespace testing
}  // namespace stratlab
