// include/backsim/backtest/run_state.hpp
#pragma once

#include "backsim/backtest/backtest_config.hpp"
#include "backsim/backtest/equity_tracker.hpp"
#include "backsim/backtest/position_manager.hpp"
#include "backsim/indicators/indicator_set.hpp"

namespace backsim {
namespace backtest {

/**
 * @brief All mutable state of one run
 *
 * Created and owned by a single BacktestRunner::run invocation; never shared.
 */
struct RunState {
    RunState(const BacktestConfig& config, IndicatorSet indicator_set)
        : indicators(std::move(indicator_set)),
          positions(config.initial_balance,
                    PositionSizing{config.position_size_percent, config.commission_percent,
                                   config.slippage_percent},
                    RiskController(config.stop_loss_percent, config.take_profit_percent)),
          equity(config.initial_balance) {}

    IndicatorSet indicators;
    PositionManager positions;
    EquityTracker equity;

    size_t candles_processed{0};
    const Candle* last_candle{nullptr};
};

}  // namespace backtest
}  // namespace backsim
