// include/backsim/backtest/position_manager.hpp
#pragma once

#include <optional>
#include <vector>
#include "backsim/backtest/risk_controller.hpp"
#include "backsim/backtest/types.hpp"
#include "backsim/core/types.hpp"

namespace backsim {
namespace backtest {

/**
 * @brief Sizing and cost settings applied to every fill
 */
struct PositionSizing {
    double position_size_percent{10.0};
    double commission_percent{0.0};
    double slippage_percent{0.0};
};

/**
 * @brief Build the Trade that closing `position` at `exit_price` produces
 *
 * pnl = gross - entry commission - exit commission, where the exit
 * commission is charged at `commission_percent` of the exit notional.
 */
Trade close_trade(const Position& position, Price exit_price, Timestamp exit_timestamp,
                  ExitReason reason, double commission_percent);

/**
 * @brief FLAT / OPEN state machine for the single position of a run
 *
 * Owns the run's cash, the open position and the trade ledger.
 *
 * Entry: quantity = cash * size% / entry price; cash is debited the
 * collateral (quantity * entry price) plus commission for both sides.
 * When that debit would exceed the cash (large sizes with commission) the
 * quantity is reduced so cash never goes negative.
 * Exit: cash is credited the collateral plus gross P&L minus the exit
 * commission, and a Trade is appended.
 */
class PositionManager {
public:
    PositionManager(double initial_cash, PositionSizing sizing, RiskController risk);

    /**
     * @brief Open a position at the candle close, adjusted for slippage
     * @return false if already open or the entry is unfillable (bad price,
     *         no cash); the reason is logged
     */
    bool open(PositionSide side, const Candle& candle);

    /**
     * @brief Close at the candle close, adjusted for slippage
     */
    std::optional<Trade> close_on_signal(const Candle& candle);

    /**
     * @brief Close at an exact price, as used for stop-loss and take-profit
     */
    std::optional<Trade> close_at(Price exit_price, Timestamp exit_timestamp, ExitReason reason);

    bool is_open() const {
        return position_.has_value();
    }

    const std::optional<Position>& position() const {
        return position_;
    }

    double cash() const {
        return cash_;
    }

    const std::vector<Trade>& trades() const {
        return trades_;
    }

    /**
     * @brief Cash plus the open position's market value at `mark_price`
     */
    double equity(Price mark_price) const;

    /**
     * @brief Gross P&L at `mark_price` minus the paid entry commission
     */
    double unrealized_pnl(Price mark_price) const;

    const RiskController& risk() const {
        return risk_;
    }

private:
    double commission_for(Quantity quantity, Price price) const;

    double cash_;
    PositionSizing sizing_;
    RiskController risk_;
    std::optional<Position> position_;
    std::vector<Trade> trades_;
};

}  // namespace backtest
}  // namespace backsim
