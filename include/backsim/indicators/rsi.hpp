// include/backsim/indicators/rsi.hpp
#pragma once

#include <optional>
#include "backsim/indicators/indicator_interface.hpp"
#include "backsim/indicators/rolling_window.hpp"

namespace backsim {

/**
 * @brief Relative strength index over the trailing `period` price changes
 *
 * RS = avgGain / avgLoss, RSI = 100 - 100 / (1 + RS). A window without any
 * loss yields 100. Needs period + 1 candles before the first value.
 *
 * With `wilders_smoothing` the first averages are the trailing means and
 * later ones follow avg = (avg * (period - 1) + x) / period.
 */
class RsiCalculator : public IndicatorCalculator {
public:
    explicit RsiCalculator(IndicatorSpec spec);

    /**
     * @brief RSI from average gain and loss, 100 when avg_loss is zero
     */
    static double rsi_from_averages(double avg_gain, double avg_loss);

protected:
    std::optional<double> compute(const Candle& candle) override;
    void clear_state() override;

private:
    RollingWindow<double> gains_;
    RollingWindow<double> losses_;
    std::optional<double> previous_price_;
    double avg_gain_{0.0};
    double avg_loss_{0.0};
    bool seeded_{false};
};

}  // namespace backsim
