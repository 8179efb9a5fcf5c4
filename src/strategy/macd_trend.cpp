// src/strategy/macd_trend.cpp
#include "backsim/strategy/macd_trend.hpp"
#include <memory>
#include "backsim/strategy/signal_utils.hpp"

namespace backsim {

namespace {
const char* const MACD_NAME = "macd";
}

MacdTrendStrategy::MacdTrendStrategy(MacdTrendParams params)
    : params_(params),
      metadata_{ID, "MACD Trend", "Follows the sign of the MACD histogram"} {}

Result<std::unique_ptr<StrategyInterface>> MacdTrendStrategy::create(
    const StrategyParams& params) {
    using Ptr = std::unique_ptr<StrategyInterface>;

    auto fast = period_param(params, "fast_period", 12, ID);
    if (fast.is_error()) {
        return make_error<Ptr>(fast.error()->code(), fast.error()->what(), ID);
    }
    auto slow = period_param(params, "slow_period", 26, ID);
    if (slow.is_error()) {
        return make_error<Ptr>(slow.error()->code(), slow.error()->what(), ID);
    }
    auto signal = period_param(params, "signal_period", 9, ID);
    if (signal.is_error()) {
        return make_error<Ptr>(signal.error()->code(), signal.error()->what(), ID);
    }
    if (fast.value() >= slow.value()) {
        return make_error<Ptr>(ErrorCode::INVALID_CONFIG,
                               "fast_period must be shorter than slow_period", ID);
    }
    auto side = direction_param(params, ID);
    if (side.is_error()) {
        return make_error<Ptr>(side.error()->code(), side.error()->what(), ID);
    }

    MacdTrendParams p;
    p.fast_period = fast.value();
    p.slow_period = slow.value();
    p.signal_period = signal.value();
    p.side = side.value();
    return Result<Ptr>(std::make_unique<MacdTrendStrategy>(p));
}

std::vector<IndicatorSpec> MacdTrendStrategy::required_indicators() const {
    IndicatorSpec macd;
    macd.name = MACD_NAME;
    macd.type = IndicatorType::MACD_HISTOGRAM;
    macd.fast_period = params_.fast_period;
    macd.slow_period = params_.slow_period;
    macd.signal_period = params_.signal_period;
    return {macd};
}

StrategySignal MacdTrendStrategy::evaluate(const Candle& /*candle*/,
                                           const IndicatorValues& indicators,
                                           const std::optional<Position>& position) const {
    StrategySignal signal;
    signal.side = params_.side;

    const IndicatorSnapshot* hist = find_indicator(indicators, MACD_NAME);
    if (!hist) {
        return signal;
    }

    bool turned_up = crossed_above_level(*hist, 0.0);
    bool turned_down = crossed_below_level(*hist, 0.0);
    bool is_long = params_.side == PositionSide::LONG;

    if (!position) {
        signal.enter = is_long ? turned_up : turned_down;
    } else {
        signal.exit = is_long ? turned_down : turned_up;
    }
    return signal;
}

}  // namespace backsim
