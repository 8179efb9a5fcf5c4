// src/backtest/result_serialization.cpp
#include "backsim/backtest/result_serialization.hpp"
#include "backsim/core/time_utils.hpp"

namespace backsim {
namespace backtest {

nlohmann::json to_json(const Trade& trade) {
    nlohmann::json j;
    j["side"] = side_to_string(trade.side);
    j["entry_timestamp"] = core::to_epoch_seconds(trade.entry_timestamp);
    j["exit_timestamp"] = core::to_epoch_seconds(trade.exit_timestamp);
    j["entry_price"] = trade.entry_price;
    j["exit_price"] = trade.exit_price;
    j["quantity"] = trade.quantity;
    j["pnl"] = trade.pnl;
    j["pnl_percent"] = trade.pnl_percent;
    j["exit_reason"] = exit_reason_to_string(trade.exit_reason);
    j["duration_seconds"] = trade.duration_seconds;
    j["commission"] = trade.commission;
    return j;
}

nlohmann::json to_json(const Position& position) {
    nlohmann::json j;
    j["side"] = side_to_string(position.side);
    j["entry_price"] = position.entry_price;
    j["quantity"] = position.quantity;
    j["entry_timestamp"] = core::to_epoch_seconds(position.entry_timestamp);
    j["stop_price"] = position.stop_price;
    j["take_profit_price"] = position.take_profit_price;
    j["entry_commission"] = position.entry_commission;
    return j;
}

nlohmann::json to_json(const EquityPoint& point) {
    nlohmann::json j;
    j["timestamp"] = core::to_epoch_seconds(point.timestamp);
    j["equity"] = point.equity;
    return j;
}

nlohmann::json to_json(const BacktestResult& result, bool include_equity_curve) {
    nlohmann::json j;
    j["status"] = run_status_to_string(result.status);
    j["symbol"] = result.symbol;
    j["strategy_id"] = result.strategy_id;
    j["initial_balance"] = result.initial_balance;
    j["final_balance"] = result.final_balance;
    j["total_return_percent"] = result.total_return_percent;

    j["total_trades"] = result.total_trades;
    j["winning_trades"] = result.winning_trades;
    j["losing_trades"] = result.losing_trades;
    j["win_rate"] = result.win_rate;
    j["average_trade"] = result.average_trade;
    j["best_trade"] = result.best_trade;
    j["worst_trade"] = result.worst_trade;
    j["profit_factor"] = result.profit_factor;
    j["average_win"] = result.average_win;
    j["average_loss"] = result.average_loss;
    j["average_trade_duration_seconds"] = result.average_trade_duration_seconds;
    j["total_commission"] = result.total_commission;

    j["max_drawdown_percent"] = result.max_drawdown_percent;
    j["sharpe_ratio"] = result.sharpe_ratio;
    j["sortino_ratio"] = result.sortino_ratio;

    j["open_position"] =
        result.open_position ? to_json(*result.open_position) : nlohmann::json(nullptr);
    j["unrealized_pnl"] = result.unrealized_pnl;
    j["candles_processed"] = result.candles_processed;
    j["total_candles"] = result.total_candles;

    nlohmann::json trades = nlohmann::json::array();
    for (const auto& trade : result.trades) {
        trades.push_back(to_json(trade));
    }
    j["trades"] = trades;

    if (include_equity_curve) {
        nlohmann::json curve = nlohmann::json::array();
        for (const auto& point : result.equity_curve) {
            curve.push_back(to_json(point));
        }
        j["equity_curve"] = curve;
    }
    return j;
}

}  // namespace backtest
}  // namespace backsim
