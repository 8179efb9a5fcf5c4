#include "backsim/indicators/donchian.hpp"

namespace backsim {

DonchianCalculator::DonchianCalculator(IndicatorSpec spec)
    : IndicatorCalculator(std::move(spec)),
      upper_(spec_.type == IndicatorType::DONCHIAN_UPPER),
      window_(static_cast<size_t>(spec_.period > 0 ? spec_.period : 0)) {}

std::optional<double> DonchianCalculator::compute(const Candle& candle) {
    std::optional<double> band;
    if (window_.full()) {
        band = upper_ ? window_.max() : window_.min();
    }
    window_.push(upper_ ? candle.high : candle.low);
    return band;
}

void DonchianCalculator::clear_state() {
    window_.clear();
}

}  // namespace backsim
