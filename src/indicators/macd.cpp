#include "backsim/indicators/macd.hpp"

namespace backsim {

MacdCalculator::MacdCalculator(IndicatorSpec spec)
    : IndicatorCalculator(std::move(spec)),
      fast_(spec_.fast_period),
      slow_(spec_.slow_period),
      signal_(spec_.signal_period) {}

std::optional<double> MacdCalculator::compute(const Candle& candle) {
    double price = extract_price(candle, spec_.source);

    auto fast = fast_.push(price);
    auto slow = slow_.push(price);
    if (!fast || !slow) {
        return std::nullopt;
    }

    double macd_line = *fast - *slow;
    auto signal = signal_.push(macd_line);
    if (!signal) {
        return std::nullopt;
    }

    return macd_line - *signal;
}

void MacdCalculator::clear_state() {
    fast_.clear();
    slow_.clear();
    signal_.clear();
}

}  // namespace backsim
