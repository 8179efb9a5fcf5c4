// src/strategy/breakout.cpp
#include "backsim/strategy/breakout.hpp"
#include <memory>
#include "backsim/strategy/signal_utils.hpp"

namespace backsim {

namespace {
const char* const UPPER_NAME = "donchian_upper";
const char* const LOWER_NAME = "donchian_lower";
}  // namespace

BreakoutStrategy::BreakoutStrategy(BreakoutParams params)
    : params_(params),
      metadata_{ID, "Breakout", "Trades closes outside the prior Donchian channel"} {}

Result<std::unique_ptr<StrategyInterface>> BreakoutStrategy::create(const StrategyParams& params) {
    using Ptr = std::unique_ptr<StrategyInterface>;

    auto lookback = period_param(params, "lookback", 20, ID);
    if (lookback.is_error()) {
        return make_error<Ptr>(lookback.error()->code(), lookback.error()->what(), ID);
    }
    auto side = direction_param(params, ID);
    if (side.is_error()) {
        return make_error<Ptr>(side.error()->code(), side.error()->what(), ID);
    }

    BreakoutParams p;
    p.lookback = lookback.value();
    p.side = side.value();
    return Result<Ptr>(std::make_unique<BreakoutStrategy>(p));
}

std::vector<IndicatorSpec> BreakoutStrategy::required_indicators() const {
    IndicatorSpec upper;
    upper.name = UPPER_NAME;
    upper.type = IndicatorType::DONCHIAN_UPPER;
    upper.period = params_.lookback;

    IndicatorSpec lower;
    lower.name = LOWER_NAME;
    lower.type = IndicatorType::DONCHIAN_LOWER;
    lower.period = params_.lookback;

    return {upper, lower};
}

StrategySignal BreakoutStrategy::evaluate(const Candle& candle, const IndicatorValues& indicators,
                                          const std::optional<Position>& position) const {
    StrategySignal signal;
    signal.side = params_.side;

    const IndicatorSnapshot* upper = find_indicator(indicators, UPPER_NAME);
    const IndicatorSnapshot* lower = find_indicator(indicators, LOWER_NAME);
    if (!upper || !lower || !upper->ready || !lower->ready) {
        return signal;
    }

    bool broke_up = candle.close > upper->value;
    bool broke_down = candle.close < lower->value;
    bool is_long = params_.side == PositionSide::LONG;

    if (!position) {
        signal.enter = is_long ? broke_up : broke_down;
    } else {
        signal.exit = is_long ? broke_down : broke_up;
    }
    return signal;
}

}  // namespace backsim
