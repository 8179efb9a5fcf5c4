// src/backtest/risk_controller.cpp
#include "backsim/backtest/risk_controller.hpp"

namespace backsim {
namespace backtest {

RiskController::RiskController(double stop_loss_percent, double take_profit_percent)
    : stop_loss_fraction_(stop_loss_percent / 100.0),
      take_profit_fraction_(take_profit_percent / 100.0) {}

Price RiskController::stop_price(PositionSide side, Price entry_price) const {
    return side == PositionSide::LONG ? entry_price * (1.0 - stop_loss_fraction_)
                                      : entry_price * (1.0 + stop_loss_fraction_);
}

Price RiskController::take_profit_price(PositionSide side, Price entry_price) const {
    return side == PositionSide::LONG ? entry_price * (1.0 + take_profit_fraction_)
                                      : entry_price * (1.0 - take_profit_fraction_);
}

std::optional<RiskExit> RiskController::check(const Position& position,
                                              const Candle& candle) const {
    if (position.side == PositionSide::LONG) {
        if (candle.low <= position.stop_price) {
            return RiskExit{ExitReason::STOP_LOSS, position.stop_price};
        }
        if (candle.high >= position.take_profit_price) {
            return RiskExit{ExitReason::TAKE_PROFIT, position.take_profit_price};
        }
        return std::nullopt;
    }

    if (candle.high >= position.stop_price) {
        return RiskExit{ExitReason::STOP_LOSS, position.stop_price};
    }
    if (candle.low <= position.take_profit_price) {
        return RiskExit{ExitReason::TAKE_PROFIT, position.take_profit_price};
    }
    return std::nullopt;
}

}  // namespace backtest
}  // namespace backsim
