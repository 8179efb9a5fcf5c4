// include/backsim/strategy/strategy_interface.hpp
#pragma once

#include <optional>
#include <vector>
#include "backsim/core/types.hpp"
#include "backsim/indicators/types.hpp"
#include "backsim/strategy/types.hpp"

namespace backsim {

/**
 * @brief Interface for all strategy variants
 *
 * `evaluate` must be a pure function of its arguments: implementations hold
 * only their immutable parameters. Indicator state lives in the run's
 * IndicatorSet, built from `required_indicators()`.
 */
class StrategyInterface {
public:
    virtual ~StrategyInterface() = default;

    virtual const StrategyMetadata& metadata() const = 0;

    /**
     * @brief Indicators the runner must maintain for this strategy
     */
    virtual std::vector<IndicatorSpec> required_indicators() const = 0;

    /**
     * @brief Decide entry/exit intent for the current candle
     * @param candle Current candle
     * @param indicators Snapshots after updating with `candle`
     * @param position Open position, if any
     */
    virtual StrategySignal evaluate(const Candle& candle, const IndicatorValues& indicators,
                                    const std::optional<Position>& position) const = 0;
};

}  // namespace backsim
