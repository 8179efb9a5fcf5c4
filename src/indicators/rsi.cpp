#include "backsim/indicators/rsi.hpp"

namespace backsim {

RsiCalculator::RsiCalculator(IndicatorSpec spec)
    : IndicatorCalculator(std::move(spec)),
      gains_(static_cast<size_t>(spec_.period > 0 ? spec_.period : 0)),
      losses_(static_cast<size_t>(spec_.period > 0 ? spec_.period : 0)) {}

double RsiCalculator::rsi_from_averages(double avg_gain, double avg_loss) {
    if (avg_loss <= 0.0) {
        return 100.0;
    }
    double rs = avg_gain / avg_loss;
    return 100.0 - 100.0 / (1.0 + rs);
}

std::optional<double> RsiCalculator::compute(const Candle& candle) {
    double price = extract_price(candle, spec_.source);

    if (!previous_price_) {
        previous_price_ = price;
        return std::nullopt;
    }

    double change = price - *previous_price_;
    previous_price_ = price;

    double gain = change > 0.0 ? change : 0.0;
    double loss = change < 0.0 ? -change : 0.0;
    gains_.push(gain);
    losses_.push(loss);

    if (!gains_.full()) {
        return std::nullopt;
    }

    if (!spec_.wilders_smoothing || !seeded_) {
        avg_gain_ = gains_.mean();
        avg_loss_ = losses_.mean();
        seeded_ = true;
    } else {
        double period = static_cast<double>(spec_.period);
        avg_gain_ = (avg_gain_ * (period - 1.0) + gain) / period;
        avg_loss_ = (avg_loss_ * (period - 1.0) + loss) / period;
    }

    return rsi_from_averages(avg_gain_, avg_loss_);
}

void RsiCalculator::clear_state() {
    gains_.clear();
    losses_.clear();
    previous_price_.reset();
    avg_gain_ = 0.0;
    avg_loss_ = 0.0;
    seeded_ = false;
}

}  // namespace backsim
