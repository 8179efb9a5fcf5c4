// src/strategy/rsi_mean_reversion.cpp
#include "backsim/strategy/rsi_mean_reversion.hpp"
#include <memory>
#include "backsim/strategy/signal_utils.hpp"

namespace backsim {

namespace {
const char* const RSI_NAME = "rsi";
}

RsiMeanReversionStrategy::RsiMeanReversionStrategy(RsiMeanReversionParams params)
    : params_(params),
      metadata_{ID, "RSI Mean Reversion", "Fades RSI extremes at fixed thresholds"} {}

Result<std::unique_ptr<StrategyInterface>> RsiMeanReversionStrategy::create(
    const StrategyParams& params) {
    using Ptr = std::unique_ptr<StrategyInterface>;

    auto period = period_param(params, "rsi_period", 14, ID);
    if (period.is_error()) {
        return make_error<Ptr>(period.error()->code(), period.error()->what(), ID);
    }

    double oversold = get_param(params, "oversold", 30.0);
    double overbought = get_param(params, "overbought", 70.0);
    if (!(oversold > 0.0) || !(overbought < 100.0) || !(oversold < overbought)) {
        return make_error<Ptr>(ErrorCode::INVALID_CONFIG,
                               "thresholds must satisfy 0 < oversold < overbought < 100", ID);
    }

    auto side = direction_param(params, ID);
    if (side.is_error()) {
        return make_error<Ptr>(side.error()->code(), side.error()->what(), ID);
    }

    RsiMeanReversionParams p;
    p.period = period.value();
    p.oversold = oversold;
    p.overbought = overbought;
    p.wilders_smoothing = get_param(params, "wilders_smoothing", 0.0) != 0.0;
    p.side = side.value();
    return Result<Ptr>(std::make_unique<RsiMeanReversionStrategy>(p));
}

std::vector<IndicatorSpec> RsiMeanReversionStrategy::required_indicators() const {
    IndicatorSpec rsi;
    rsi.name = RSI_NAME;
    rsi.type = IndicatorType::RSI;
    rsi.period = params_.period;
    rsi.wilders_smoothing = params_.wilders_smoothing;
    return {rsi};
}

StrategySignal RsiMeanReversionStrategy::evaluate(const Candle& /*candle*/,
                                                  const IndicatorValues& indicators,
                                                  const std::optional<Position>& position) const {
    StrategySignal signal;
    signal.side = params_.side;

    const IndicatorSnapshot* rsi = find_indicator(indicators, RSI_NAME);
    if (!rsi || !rsi->ready) {
        return signal;
    }

    bool oversold = rsi->value < params_.oversold;
    bool overbought = rsi->value > params_.overbought;
    bool is_long = params_.side == PositionSide::LONG;

    if (!position) {
        signal.enter = is_long ? oversold : overbought;
    } else {
        signal.exit = is_long ? overbought : oversold;
    }
    return signal;
}

}  // namespace backsim
