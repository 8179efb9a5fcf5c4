// include/backsim/backtest/equity_tracker.hpp
#pragma once

#include <vector>
#include "backsim/backtest/types.hpp"

namespace backsim {
namespace backtest {

/**
 * @brief Equity curve, running peak and maximum drawdown of a run
 *
 * The peak starts at the initial balance. Drawdown is measured against the
 * peak updated with the current point, so it is never taken from a stale peak.
 */
class EquityTracker {
public:
    explicit EquityTracker(double initial_balance);

    void record(Timestamp timestamp, double equity);

    const std::vector<EquityPoint>& curve() const {
        return curve_;
    }

    double peak() const {
        return peak_;
    }

    double max_drawdown_percent() const {
        return max_drawdown_percent_;
    }

    double current_drawdown_percent() const;

    double last_equity() const;

private:
    double initial_balance_;
    double peak_;
    double max_drawdown_percent_{0.0};
    std::vector<EquityPoint> curve_;
};

}  // namespace backtest
}  // namespace backsim
