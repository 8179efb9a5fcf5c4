// include/backsim/indicators/macd.hpp
#pragma once

#include <optional>
#include "backsim/indicators/indicator_interface.hpp"
#include "backsim/indicators/moving_average.hpp"

namespace backsim {

/**
 * @brief MACD histogram: (EMA(fast) - EMA(slow)) - EMA(signal) of that line
 *
 * The signal EMA only receives MACD values once both price EMAs are ready,
 * so the first histogram value appears after slow_period + signal_period - 1
 * candles. A sign change of the histogram is a MACD/signal crossover.
 */
class MacdCalculator : public IndicatorCalculator {
public:
    explicit MacdCalculator(IndicatorSpec spec);

protected:
    std::optional<double> compute(const Candle& candle) override;
    void clear_state() override;

private:
    EmaState fast_;
    EmaState slow_;
    EmaState signal_;
};

}  // namespace backsim
