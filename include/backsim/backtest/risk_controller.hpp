// include/backsim/backtest/risk_controller.hpp
#pragma once

#include <optional>
#include "backsim/backtest/types.hpp"
#include "backsim/core/types.hpp"

namespace backsim {
namespace backtest {

/**
 * @brief A stop-loss or take-profit hit, filled exactly at its level
 */
struct RiskExit {
    ExitReason reason{ExitReason::STOP_LOSS};
    Price price{0.0};
};

/**
 * @brief Stateless stop-loss / take-profit rules
 *
 * Checked against the candle range before the strategy runs. When both
 * levels are inside the same candle the stop-loss wins.
 */
class RiskController {
public:
    RiskController(double stop_loss_percent, double take_profit_percent);

    Price stop_price(PositionSide side, Price entry_price) const;
    Price take_profit_price(PositionSide side, Price entry_price) const;

    /**
     * @brief Return the exit triggered by the candle, if any
     */
    std::optional<RiskExit> check(const Position& position, const Candle& candle) const;

private:
    double stop_loss_fraction_;
    double take_profit_fraction_;
};

}  // namespace backtest
}  // namespace backsim
