// include/backsim/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace backsim {

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
 * Double to support fractional quantities
 */
using Quantity = double;

/**
 * @brief Direction of an open position
 */
enum class PositionSide {
    LONG,
    SHORT
};

/**
 * @brief Signed multiplier for P&L: +1 for long, -1 for short
 */
inline double side_sign(PositionSide side) {
    return side == PositionSide::LONG ? 1.0 : -1.0;
}

inline std::string side_to_string(PositionSide side) {
    return side == PositionSide::LONG ? "long" : "short";
}

/**
 * @brief OHLCV bar for one fixed time interval
 */
struct Candle {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};

    Candle() = default;
    Candle(Timestamp ts, Price o, Price h, Price l, Price c, double v)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v) {}
};

/**
 * @brief The single open position of a run
 *
 * Exists only between an entry and its exit. Cash equal to
 * quantity * entry_price is held against it for both sides, so its market
 * value is that collateral plus unrealized gross P&L.
 */
struct Position {
    PositionSide side{PositionSide::LONG};
    Price entry_price{0.0};
    Quantity quantity{0.0};
    Timestamp entry_timestamp;
    Price stop_price{0.0};
    Price take_profit_price{0.0};
    double entry_commission{0.0};

    /**
     * @brief Gross P&L if closed at the given price
     */
    double gross_pnl_at(Price price) const {
        return side_sign(side) * quantity * (price - entry_price);
    }

    /**
     * @brief Collateral plus gross P&L at the given price
     */
    double market_value_at(Price price) const {
        return quantity * entry_price + gross_pnl_at(price);
    }
};

/**
 * @brief Bar interval of a candle series
 */
enum class Timeframe {
    MINUTE_1,   // 1m
    MINUTE_5,   // 5m
    MINUTE_15,  // 15m
    MINUTE_30,  // 30m
    HOURLY,     // 1h
    HOURS_4,    // 4h
    DAILY,      // 1d
    WEEKLY      // 1w
};

inline std::string timeframe_to_string(Timeframe tf) {
    switch (tf) {
        case Timeframe::MINUTE_1:
            return "1m";
        case Timeframe::MINUTE_5:
            return "5m";
        case Timeframe::MINUTE_15:
            return "15m";
        case Timeframe::MINUTE_30:
            return "30m";
        case Timeframe::HOURLY:
            return "1h";
        case Timeframe::HOURS_4:
            return "4h";
        case Timeframe::DAILY:
            return "1d";
        case Timeframe::WEEKLY:
            return "1w";
        default:
            return "1d";
    }
}

/**
 * @brief Parse a timeframe label such as "15m" or "1d"
 * @return true and sets out on success, false for an unknown label
 */
inline bool timeframe_from_string(const std::string& label, Timeframe& out) {
    if (label == "1m")
        out = Timeframe::MINUTE_1;
    else if (label == "5m")
        out = Timeframe::MINUTE_5;
    else if (label == "15m")
        out = Timeframe::MINUTE_15;
    else if (label == "30m")
        out = Timeframe::MINUTE_30;
    else if (label == "1h")
        out = Timeframe::HOURLY;
    else if (label == "4h")
        out = Timeframe::HOURS_4;
    else if (label == "1d")
        out = Timeframe::DAILY;
    else if (label == "1w")
        out = Timeframe::WEEKLY;
    else
        return false;
    return true;
}

/**
 * @brief Length of one bar in seconds
 */
inline int64_t timeframe_seconds(Timeframe tf) {
    switch (tf) {
        case Timeframe::MINUTE_1:
            return 60;
        case Timeframe::MINUTE_5:
            return 5 * 60;
        case Timeframe::MINUTE_15:
            return 15 * 60;
        case Timeframe::MINUTE_30:
            return 30 * 60;
        case Timeframe::HOURLY:
            return 60 * 60;
        case Timeframe::HOURS_4:
            return 4 * 60 * 60;
        case Timeframe::DAILY:
            return 24 * 60 * 60;
        case Timeframe::WEEKLY:
            return 7 * 24 * 60 * 60;
        default:
            return 24 * 60 * 60;
    }
}

/**
 * @brief Number of bars in a calendar year (markets assumed open around the clock)
 */
inline double periods_per_year(Timeframe tf) {
    return 365.0 * 24.0 * 60.0 * 60.0 / static_cast<double>(timeframe_seconds(tf));
}

}  // namespace backsim
