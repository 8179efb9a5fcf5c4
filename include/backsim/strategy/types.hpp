// include/backsim/strategy/types.hpp
#pragma once

#include <string>
#include <unordered_map>
#include "backsim/core/types.hpp"

namespace backsim {

/**
 * @brief Intent emitted by a strategy for one candle
 *
 * `enter` is only honored while flat and `exit` only while a position is
 * open; `side` is the direction of a new entry.
 */
struct StrategySignal {
    bool enter{false};
    bool exit{false};
    PositionSide side{PositionSide::LONG};
};

/**
 * @brief Numeric strategy parameters keyed by name
 */
using StrategyParams = std::unordered_map<std::string, double>;

/**
 * @brief Look up a parameter, falling back to a default when absent
 */
inline double get_param(const StrategyParams& params, const std::string& name,
                        double default_value) {
    auto it = params.find(name);
    return it != params.end() ? it->second : default_value;
}

/**
 * @brief Descriptive information about a strategy variant
 */
struct StrategyMetadata {
    std::string id;
    std::string name;
    std::string description;
};

}  // namespace backsim
