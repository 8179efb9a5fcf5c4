// include/backsim/strategy/rsi_mean_reversion.hpp
#pragma once

#include <memory>
#include "backsim/core/error.hpp"
#include "backsim/strategy/strategy_interface.hpp"

namespace backsim {

struct RsiMeanReversionParams {
    int period{14};
    double oversold{30.0};
    double overbought{70.0};
    bool wilders_smoothing{false};
    PositionSide side{PositionSide::LONG};
};

/**
 * @brief RSI threshold mean reversion
 *
 * Long: enter when RSI is below `oversold`, exit when above `overbought`.
 * Short: enter above `overbought`, exit below `oversold`.
 */
class RsiMeanReversionStrategy : public StrategyInterface {
public:
    static constexpr const char* ID = "rsi_mean_reversion";

    explicit RsiMeanReversionStrategy(RsiMeanReversionParams params);

    /**
     * @brief Build from raw parameters
     *
     * Recognized keys: rsi_period, oversold, overbought, wilders_smoothing (0/1),
     * direction.
     */
    static Result<std::unique_ptr<StrategyInterface>> create(const StrategyParams& params);

    const StrategyMetadata& metadata() const override {
        return metadata_;
    }
    std::vector<IndicatorSpec> required_indicators() const override;
    StrategySignal evaluate(const Candle& candle, const IndicatorValues& indicators,
                            const std::optional<Position>& position) const override;

    const RsiMeanReversionParams& params() const {
        return params_;
    }

private:
    RsiMeanReversionParams params_;
    StrategyMetadata metadata_;
};

}  // namespace backsim
