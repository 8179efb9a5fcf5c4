// include/backsim/indicators/types.hpp
#pragma once

#include <string>
#include <unordered_map>
#include "backsim/core/types.hpp"

namespace backsim {

/**
 * @brief Supported indicator calculators
 */
enum class IndicatorType {
    SMA,
    EMA,
    RSI,
    MACD_HISTOGRAM,
    DONCHIAN_UPPER,
    DONCHIAN_LOWER
};

inline std::string indicator_type_to_string(IndicatorType type) {
    switch (type) {
        case IndicatorType::SMA:
            return "SMA";
        case IndicatorType::EMA:
            return "EMA";
        case IndicatorType::RSI:
            return "RSI";
        case IndicatorType::MACD_HISTOGRAM:
            return "MACD_HISTOGRAM";
        case IndicatorType::DONCHIAN_UPPER:
            return "DONCHIAN_UPPER";
        case IndicatorType::DONCHIAN_LOWER:
            return "DONCHIAN_LOWER";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Which candle price an indicator consumes
 */
enum class PriceField {
    OPEN,
    HIGH,
    LOW,
    CLOSE,
    HL2,   // (high + low) / 2
    HLC3,  // (high + low + close) / 3
    OHLC4  // (open + high + low + close) / 4
};

inline double extract_price(const Candle& candle, PriceField field) {
    switch (field) {
        case PriceField::OPEN:
            return candle.open;
        case PriceField::HIGH:
            return candle.high;
        case PriceField::LOW:
            return candle.low;
        case PriceField::CLOSE:
            return candle.close;
        case PriceField::HL2:
            return (candle.high + candle.low) / 2.0;
        case PriceField::HLC3:
            return (candle.high + candle.low + candle.close) / 3.0;
        case PriceField::OHLC4:
            return (candle.open + candle.high + candle.low + candle.close) / 4.0;
        default:
            return candle.close;
    }
}

/**
 * @brief Declarative description of one indicator instance
 *
 * `period` is the lookback for SMA, EMA, RSI and Donchian. MACD uses
 * `fast_period`, `slow_period` and `signal_period` instead.
 */
struct IndicatorSpec {
    std::string name;
    IndicatorType type{IndicatorType::EMA};
    int period{14};
    int fast_period{12};
    int slow_period{26};
    int signal_period{9};
    PriceField source{PriceField::CLOSE};
    bool wilders_smoothing{false};  // RSI only
};

/**
 * @brief Read-only view of an indicator after one update
 *
 * When `ready` is false the indicator is warming up and `value` must be
 * treated as "no value", never as zero.
 */
struct IndicatorSnapshot {
    bool ready{false};
    double value{0.0};
    bool previous_ready{false};
    double previous_value{0.0};
};

/**
 * @brief Snapshots of every indicator for the current candle, keyed by spec name
 */
using IndicatorValues = std::unordered_map<std::string, IndicatorSnapshot>;

}  // namespace backsim
