// include/backsim/strategy/breakout.hpp
#pragma once

#include <memory>
#include "backsim/core/error.hpp"
#include "backsim/strategy/strategy_interface.hpp"

namespace backsim {

struct BreakoutParams {
    int lookback{20};
    PositionSide side{PositionSide::LONG};
};

/**
 * @brief Donchian channel breakout
 *
 * Long: enter when the close exceeds the highest high of the previous
 * `lookback` candles, exit when it falls below the lowest low. Short mirrors.
 */
class BreakoutStrategy : public StrategyInterface {
public:
    static constexpr const char* ID = "breakout";

    explicit BreakoutStrategy(BreakoutParams params);

    /**
     * @brief Build from raw parameters
     *
     * Recognized keys: lookback, direction.
     */
    static Result<std::unique_ptr<StrategyInterface>> create(const StrategyParams& params);

    const StrategyMetadata& metadata() const override {
        return metadata_;
    }
    std::vector<IndicatorSpec> required_indicators() const override;
    StrategySignal evaluate(const Candle& candle, const IndicatorValues& indicators,
                            const std::optional<Position>& position) const override;

    const BreakoutParams& params() const {
        return params_;
    }

private:
    BreakoutParams params_;
    StrategyMetadata metadata_;
};

}  // namespace backsim
