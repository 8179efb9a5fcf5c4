// src/backtest/equity_tracker.cpp
#include "backsim/backtest/equity_tracker.hpp"
#include <algorithm>

namespace backsim {
namespace backtest {

EquityTracker::EquityTracker(double initial_balance)
    : initial_balance_(initial_balance), peak_(initial_balance) {}

void EquityTracker::record(Timestamp timestamp, double equity) {
    curve_.push_back(EquityPoint{timestamp, equity});
    peak_ = std::max(peak_, equity);
    max_drawdown_percent_ = std::max(max_drawdown_percent_, current_drawdown_percent());
}

double EquityTracker::current_drawdown_percent() const {
    if (curve_.empty() || peak_ <= 0.0) {
        return 0.0;
    }
    return (peak_ - curve_.back().equity) / peak_ * 100.0;
}

double EquityTracker::last_equity() const {
    return curve_.empty() ? initial_balance_ : curve_.back().equity;
}

}  // namespace backtest
}  // namespace backsim
