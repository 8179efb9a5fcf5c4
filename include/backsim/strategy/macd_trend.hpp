// include/backsim/strategy/macd_trend.hpp
#pragma once

#include <memory>
#include "backsim/core/error.hpp"
#include "backsim/strategy/strategy_interface.hpp"

namespace backsim {

struct MacdTrendParams {
    int fast_period{12};
    int slow_period{26};
    int signal_period{9};
    PositionSide side{PositionSide::LONG};
};

/**
 * @brief Trades zero-line crosses of the MACD histogram
 */
class MacdTrendStrategy : public StrategyInterface {
public:
    static constexpr const char* ID = "macd_trend";

    explicit MacdTrendStrategy(MacdTrendParams params);

    /**
     * @brief Build from raw parameters
     *
     * Recognized keys: fast_period, slow_period, signal_period, direction.
     */
    static Result<std::unique_ptr<StrategyInterface>> create(const StrategyParams& params);

    const StrategyMetadata& metadata() const override {
        return metadata_;
    }
    std::vector<IndicatorSpec> required_indicators() const override;
    StrategySignal evaluate(const Candle& candle, const IndicatorValues& indicators,
                            const std::optional<Position>& position) const override;

    const MacdTrendParams& params() const {
        return params_;
    }

private:
    MacdTrendParams params_;
    StrategyMetadata metadata_;
};

}  // namespace backsim
