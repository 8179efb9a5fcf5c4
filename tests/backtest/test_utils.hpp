#pragma once

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>
#include "backsim/core/time_utils.hpp"
#include "backsim/core/types.hpp"
#include "backsim/data/candle_series.hpp"

namespace backsim {
namespace testing {

// 2021-01-01 00:00:00 UTC
constexpr int64_t BASE_EPOCH = 1609459200;
constexpr int64_t SECONDS_PER_DAY = 86400;

inline Timestamp day(int index) {
    return core::from_epoch_seconds(BASE_EPOCH + index * SECONDS_PER_DAY);
}

inline Candle make_candle(Timestamp ts, double open, double high, double low, double close,
                          double volume = 1000.0) {
    return Candle(ts, open, high, low, close, volume);
}

/**
 * @brief Daily candles whose open, high, low and close all equal the given price
 */
inline std::vector<Candle> candles_from_closes(const std::vector<double>& closes) {
    std::vector<Candle> candles;
    candles.reserve(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        double c = closes[i];
        candles.push_back(make_candle(day(static_cast<int>(i)), c, c, c, c));
    }
    return candles;
}

inline CandleSeries series_from_closes(const std::vector<double>& closes,
                                       const std::string& symbol = "BTCUSD") {
    return CandleSeries(symbol, Timeframe::DAILY, candles_from_closes(closes));
}

/**
 * @brief Deterministic oscillating daily series with realistic OHLC ranges
 */
inline std::vector<Candle> sine_wave_candles(size_t count, double base = 100.0,
                                             double amplitude = 10.0, double period = 20.0) {
    std::vector<Candle> candles;
    candles.reserve(count);
    double previous_close = base;
    for (size_t i = 0; i < count; ++i) {
        double close = base + amplitude * std::sin(2.0 * M_PI * static_cast<double>(i) / period) +
                       0.05 * static_cast<double>(i);
        double open = previous_close;
        double high = std::max(open, close) + 0.5;
        double low = std::min(open, close) - 0.5;
        candles.push_back(make_candle(day(static_cast<int>(i)), open, high, low, close));
        previous_close = close;
    }
    return candles;
}

inline CandleSeries sine_wave_series(size_t count, const std::string& symbol = "BTCUSD") {
    return CandleSeries(symbol, Timeframe::DAILY, sine_wave_candles(count));
}

/**
 * @brief Straight-line daily closes from `start`, changing by `step` per candle
 */
inline std::vector<double> linear_closes(size_t count, double start, double step) {
    std::vector<double> closes;
    closes.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        closes.push_back(start + step * static_cast<double>(i));
    }
    return closes;
}

}  // namespace testing
}  // namespace backsim
