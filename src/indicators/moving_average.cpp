#include "backsim/indicators/moving_average.hpp"

namespace backsim {

EmaState::EmaState(int period)
    : period_(period),
      alpha_(2.0 / (static_cast<double>(period) + 1.0)),
      seed_window_(static_cast<size_t>(period > 0 ? period : 0)) {}

std::optional<double> EmaState::push(double value) {
    if (!ready_) {
        seed_window_.push(value);
        if (!seed_window_.full()) {
            return std::nullopt;
        }
        ema_ = seed_window_.mean();
        ready_ = true;
        seed_window_.clear();
        return ema_;
    }

    ema_ = value * alpha_ + ema_ * (1.0 - alpha_);
    return ema_;
}

void EmaState::clear() {
    seed_window_.clear();
    ema_ = 0.0;
    ready_ = false;
}

SmaCalculator::SmaCalculator(IndicatorSpec spec)
    : IndicatorCalculator(std::move(spec)),
      window_(static_cast<size_t>(spec_.period > 0 ? spec_.period : 0)) {}

std::optional<double> SmaCalculator::compute(const Candle& candle) {
    window_.push(extract_price(candle, spec_.source));
    if (!window_.full()) {
        return std::nullopt;
    }
    return window_.mean();
}

void SmaCalculator::clear_state() {
    window_.clear();
}

EmaCalculator::EmaCalculator(IndicatorSpec spec)
    : IndicatorCalculator(std::move(spec)), state_(spec_.period) {}

std::optional<double> EmaCalculator::compute(const Candle& candle) {
    return state_.push(extract_price(candle, spec_.source));
}

void EmaCalculator::clear_state() {
    state_.clear();
}

}  // namespace backsim
