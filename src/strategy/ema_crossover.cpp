// src/strategy/ema_crossover.cpp
#include "backsim/strategy/ema_crossover.hpp"
#include <memory>
#include "backsim/strategy/signal_utils.hpp"

namespace backsim {

namespace {
const char* const FAST_NAME = "ema_fast";
const char* const SLOW_NAME = "ema_slow";
}  // namespace

EmaCrossoverStrategy::EmaCrossoverStrategy(EmaCrossoverParams params)
    : params_(params),
      metadata_{ID, "EMA Crossover",
                "Trades crosses of a fast EMA over a slow EMA"} {}

Result<std::unique_ptr<StrategyInterface>> EmaCrossoverStrategy::create(
    const StrategyParams& params) {
    using Ptr = std::unique_ptr<StrategyInterface>;

    auto fast = period_param(params, "fast_period", 10, ID);
    if (fast.is_error()) {
        return make_error<Ptr>(fast.error()->code(), fast.error()->what(), ID);
    }
    auto slow = period_param(params, "slow_period", 20, ID);
    if (slow.is_error()) {
        return make_error<Ptr>(slow.error()->code(), slow.error()->what(), ID);
    }
    if (fast.value() >= slow.value()) {
        return make_error<Ptr>(ErrorCode::INVALID_CONFIG,
                               "fast_period must be shorter than slow_period", ID);
    }
    auto side = direction_param(params, ID);
    if (side.is_error()) {
        return make_error<Ptr>(side.error()->code(), side.error()->what(), ID);
    }

    EmaCrossoverParams p;
    p.fast_period = fast.value();
    p.slow_period = slow.value();
    p.side = side.value();
    return Result<Ptr>(std::make_unique<EmaCrossoverStrategy>(p));
}

std::vector<IndicatorSpec> EmaCrossoverStrategy::required_indicators() const {
    IndicatorSpec fast;
    fast.name = FAST_NAME;
    fast.type = IndicatorType::EMA;
    fast.period = params_.fast_period;

    IndicatorSpec slow;
    slow.name = SLOW_NAME;
    slow.type = IndicatorType::EMA;
    slow.period = params_.slow_period;

    return {fast, slow};
}

StrategySignal EmaCrossoverStrategy::evaluate(const Candle& /*candle*/,
                                              const IndicatorValues& indicators,
                                              const std::optional<Position>& position) const {
    StrategySignal signal;
    signal.side = params_.side;

    const IndicatorSnapshot* fast = find_indicator(indicators, FAST_NAME);
    const IndicatorSnapshot* slow = find_indicator(indicators, SLOW_NAME);
    if (!fast || !slow) {
        return signal;
    }

    bool bullish = crossed_above(*fast, *slow);
    bool bearish = crossed_below(*fast, *slow);
    bool is_long = params_.side == PositionSide::LONG;

    if (!position) {
        signal.enter = is_long ? bullish : bearish;
    } else {
        signal.exit = is_long ? bearish : bullish;
    }
    return signal;
}

}  // namespace backsim
