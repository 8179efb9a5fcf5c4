// include/backsim/indicators/donchian.hpp
#pragma once

#include <optional>
#include "backsim/indicators/indicator_interface.hpp"
#include "backsim/indicators/rolling_window.hpp"

namespace backsim {

/**
 * @brief One band of a Donchian channel over the candles *before* the current one
 *
 * DONCHIAN_UPPER is the highest high and DONCHIAN_LOWER the lowest low of the
 * previous `period` candles. Excluding the current candle lets a close above
 * the upper band register as a breakout.
 */
class DonchianCalculator : public IndicatorCalculator {
public:
    explicit DonchianCalculator(IndicatorSpec spec);

protected:
    std::optional<double> compute(const Candle& candle) override;
    void clear_state() override;

private:
    bool upper_;
    RollingWindow<double> window_;
};

}  // namespace backsim
