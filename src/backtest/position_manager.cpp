// src/backtest/position_manager.cpp
#include "backsim/backtest/position_manager.hpp"
#include <chrono>
#include <cmath>
#include "backsim/core/logger.hpp"
#include "backsim/core/time_utils.hpp"

namespace backsim {
namespace backtest {

Trade close_trade(const Position& position, Price exit_price, Timestamp exit_timestamp,
                  ExitReason reason, double commission_percent) {
    double gross = position.gross_pnl_at(exit_price);
    double exit_commission = position.quantity * exit_price * commission_percent / 100.0;

    Trade trade;
    trade.side = position.side;
    trade.entry_timestamp = position.entry_timestamp;
    trade.exit_timestamp = exit_timestamp;
    trade.entry_price = position.entry_price;
    trade.exit_price = exit_price;
    trade.quantity = position.quantity;
    trade.pnl = gross - position.entry_commission - exit_commission;
    double notional = position.entry_price * position.quantity;
    trade.pnl_percent = notional > 0.0 ? trade.pnl / notional * 100.0 : 0.0;
    trade.exit_reason = reason;
    trade.duration_seconds = std::chrono::duration_cast<std::chrono::seconds>(
                                 exit_timestamp - position.entry_timestamp)
                                 .count();
    trade.commission = position.entry_commission + exit_commission;
    return trade;
}

PositionManager::PositionManager(double initial_cash, PositionSizing sizing, RiskController risk)
    : cash_(initial_cash), sizing_(sizing), risk_(risk) {}

double PositionManager::commission_for(Quantity quantity, Price price) const {
    return quantity * price * sizing_.commission_percent / 100.0;
}

bool PositionManager::open(PositionSide side, const Candle& candle) {
    if (position_) {
        return false;
    }

    double slippage = sizing_.slippage_percent / 100.0;
    Price entry_price = side == PositionSide::LONG ? candle.close * (1.0 + slippage)
                                                   : candle.close * (1.0 - slippage);

    if (!std::isfinite(entry_price) || entry_price <= 0.0) {
        WARN("Skipping " << side_to_string(side) << " entry at "
                         << core::format_utc(candle.timestamp) << ": invalid entry price "
                         << entry_price);
        return false;
    }
    if (!(cash_ > 0.0)) {
        WARN("Skipping " << side_to_string(side) << " entry at "
                         << core::format_utc(candle.timestamp) << ": no cash available");
        return false;
    }

    Quantity quantity = cash_ * sizing_.position_size_percent / 100.0 / entry_price;
    double commission = commission_for(quantity, entry_price);
    if (quantity * entry_price + commission > cash_) {
        // shrink so collateral plus commission fits the available cash
        quantity = cash_ / (entry_price * (1.0 + sizing_.commission_percent / 100.0));
        commission = commission_for(quantity, entry_price);
    }

    Position position;
    position.side = side;
    position.entry_price = entry_price;
    position.quantity = quantity;
    position.entry_timestamp = candle.timestamp;
    position.stop_price = risk_.stop_price(side, entry_price);
    position.take_profit_price = risk_.take_profit_price(side, entry_price);
    position.entry_commission = commission;

    cash_ -= quantity * entry_price + commission;
    position_ = position;

    DEBUG("Opened " << side_to_string(side) << " " << quantity << " @ " << entry_price
                    << " stop=" << position.stop_price
                    << " take_profit=" << position.take_profit_price);
    return true;
}

std::optional<Trade> PositionManager::close_on_signal(const Candle& candle) {
    if (!position_) {
        return std::nullopt;
    }
    double slippage = sizing_.slippage_percent / 100.0;
    Price exit_price = position_->side == PositionSide::LONG ? candle.close * (1.0 - slippage)
                                                             : candle.close * (1.0 + slippage);
    return close_at(exit_price, candle.timestamp, ExitReason::SIGNAL);
}

std::optional<Trade> PositionManager::close_at(Price exit_price, Timestamp exit_timestamp,
                                               ExitReason reason) {
    if (!position_) {
        return std::nullopt;
    }

    Trade trade =
        close_trade(*position_, exit_price, exit_timestamp, reason, sizing_.commission_percent);
    double exit_commission = commission_for(position_->quantity, exit_price);

    cash_ += position_->market_value_at(exit_price) - exit_commission;
    position_.reset();
    trades_.push_back(trade);

    DEBUG("Closed " << side_to_string(trade.side) << " @ " << exit_price << " ("
                    << exit_reason_to_string(reason) << ") pnl=" << trade.pnl);
    return trade;
}

double PositionManager::equity(Price mark_price) const {
    if (!position_) {
        return cash_;
    }
    return cash_ + position_->market_value_at(mark_price);
}

double PositionManager::unrealized_pnl(Price mark_price) const {
    if (!position_) {
        return 0.0;
    }
    return position_->gross_pnl_at(mark_price) - position_->entry_commission;
}

}  // namespace backtest
}  // namespace backsim
