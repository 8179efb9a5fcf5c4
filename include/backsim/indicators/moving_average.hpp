// include/backsim/indicators/moving_average.hpp
#pragma once

#include <optional>
#include "backsim/indicators/indicator_interface.hpp"
#include "backsim/indicators/rolling_window.hpp"

namespace backsim {

/**
 * @brief Exponential average over a plain value stream
 *
 * Seeded with the simple mean of the first `period` values, then
 * ema_t = x_t * k + ema_{t-1} * (1 - k) with k = 2 / (period + 1).
 * Shared by EmaCalculator and MacdCalculator.
 */
class EmaState {
public:
    explicit EmaState(int period);

    std::optional<double> push(double value);
    void clear();

    bool ready() const {
        return ready_;
    }

private:
    int period_;
    double alpha_;
    RollingWindow<double> seed_window_;
    double ema_{0.0};
    bool ready_{false};
};

/**
 * @brief Simple moving average of the trailing `period` prices
 */
class SmaCalculator : public IndicatorCalculator {
public:
    explicit SmaCalculator(IndicatorSpec spec);

protected:
    std::optional<double> compute(const Candle& candle) override;
    void clear_state() override;

private:
    RollingWindow<double> window_;
};

/**
 * @brief Exponential moving average; warming up until `period` candles
 */
class EmaCalculator : public IndicatorCalculator {
public:
    explicit EmaCalculator(IndicatorSpec spec);

protected:
    std::optional<double> compute(const Candle& candle) override;
    void clear_state() override;

private:
    EmaState state_;
};

}  // namespace backsim
