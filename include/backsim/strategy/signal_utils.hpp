#pragma once

#include <string>
#include "backsim/core/error.hpp"
#include "backsim/indicators/types.hpp"
#include "backsim/strategy/types.hpp"

namespace backsim {

/**
 * @brief Snapshot by name, or nullptr when the strategy's indicator is missing
 */
inline const IndicatorSnapshot* find_indicator(const IndicatorValues& values,
                                               const std::string& name) {
    auto it = values.find(name);
    return it != values.end() ? &it->second : nullptr;
}

/**
 * @brief True on the first candle where a > b
 *
 * A warming-up previous snapshot counts as "not above", so the first candle
 * on which both are ready and a > b also qualifies.
 */
inline bool crossed_above(const IndicatorSnapshot& a, const IndicatorSnapshot& b) {
    if (!a.ready || !b.ready || !(a.value > b.value)) {
        return false;
    }
    bool was_above = a.previous_ready && b.previous_ready && a.previous_value > b.previous_value;
    return !was_above;
}

inline bool crossed_below(const IndicatorSnapshot& a, const IndicatorSnapshot& b) {
    if (!a.ready || !b.ready || !(a.value < b.value)) {
        return false;
    }
    bool was_below = a.previous_ready && b.previous_ready && a.previous_value < b.previous_value;
    return !was_below;
}

inline bool crossed_above_level(const IndicatorSnapshot& s, double level) {
    if (!s.ready || !(s.value > level)) {
        return false;
    }
    return !(s.previous_ready && s.previous_value > level);
}

inline bool crossed_below_level(const IndicatorSnapshot& s, double level) {
    if (!s.ready || !(s.value < level)) {
        return false;
    }
    return !(s.previous_ready && s.previous_value < level);
}

/**
 * @brief Parse the `direction` parameter: +1 long, -1 short
 */
inline Result<PositionSide> direction_param(const StrategyParams& params,
                                            const std::string& component) {
    double direction = get_param(params, "direction", 1.0);
    if (direction == 1.0) {
        return Result<PositionSide>(PositionSide::LONG);
    }
    if (direction == -1.0) {
        return Result<PositionSide>(PositionSide::SHORT);
    }
    return make_error<PositionSide>(ErrorCode::INVALID_CONFIG,
                                    "direction must be 1 (long) or -1 (short)", component);
}

/**
 * @brief Read a whole, positive period parameter
 */
inline Result<int> period_param(const StrategyParams& params, const std::string& name,
                                int default_value, const std::string& component) {
    double raw = get_param(params, name, static_cast<double>(default_value));
    if (!(raw >= 1.0) || raw != static_cast<double>(static_cast<int>(raw))) {
        return make_error<int>(ErrorCode::INVALID_CONFIG,
                               name + " must be a positive whole number", component);
    }
    return Result<int>(static_cast<int>(raw));
}

}  // namespace backsim
