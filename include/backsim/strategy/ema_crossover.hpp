// include/backsim/strategy/ema_crossover.hpp
#pragma once

#include <memory>
#include "backsim/core/error.hpp"
#include "backsim/strategy/strategy_interface.hpp"

namespace backsim {

struct EmaCrossoverParams {
    int fast_period{10};
    int slow_period{20};
    PositionSide side{PositionSide::LONG};
};

/**
 * @brief Fast/slow EMA crossover
 *
 * Long variant enters when the fast EMA crosses above the slow EMA and exits
 * on the opposite cross. The short variant (direction = -1) mirrors it.
 */
class EmaCrossoverStrategy : public StrategyInterface {
public:
    static constexpr const char* ID = "ema_crossover";

    explicit EmaCrossoverStrategy(EmaCrossoverParams params);

    /**
     * @brief Build from raw parameters
     *
     * Recognized keys: fast_period, slow_period, direction.
     */
    static Result<std::unique_ptr<StrategyInterface>> create(const StrategyParams& params);

    const StrategyMetadata& metadata() const override {
        return metadata_;
    }
    std::vector<IndicatorSpec> required_indicators() const override;
    StrategySignal evaluate(const Candle& candle, const IndicatorValues& indicators,
                            const std::optional<Position>& position) const override;

    const EmaCrossoverParams& params() const {
        return params_;
    }

private:
    EmaCrossoverParams params_;
    StrategyMetadata metadata_;
};

}  // namespace backsim
