// include/backsim/backtest/backtest_config.hpp
#pragma once

#include <cstdint>
#include <string>
#include "backsim/core/config_base.hpp"
#include "backsim/core/error.hpp"
#include "backsim/core/types.hpp"
#include "backsim/strategy/types.hpp"

namespace backsim {
namespace backtest {

/**
 * @brief Parameters of a single backtest run
 *
 * Percent fields are in percent (5 means 5%). Timestamps are serialized as
 * epoch seconds. Validated once by the runner and never mutated during a run.
 */
struct BacktestConfig : public ConfigBase {
    std::string symbol{"BTCUSD"};
    Timeframe timeframe{Timeframe::DAILY};
    Timestamp start_time{};
    Timestamp end_time{std::chrono::seconds(4102444800LL)};  // 2100-01-01
    double initial_balance{10000.0};

    std::string strategy_id{"ema_crossover"};
    StrategyParams strategy_params;

    double position_size_percent{10.0};
    double stop_loss_percent{2.5};
    double take_profit_percent{5.0};
    double commission_percent{0.0};
    double slippage_percent{0.0};

    // Candles between progress reports, 0 for about 100 reports per run
    int64_t progress_interval{0};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;

    /**
     * @throws BacksimError with INVALID_CONFIG for an unknown timeframe label
     */
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Check ranges and the date window
     * @return INVALID_CONFIG describing the first violated constraint
     */
    Result<void> validate() const;
};

}  // namespace backtest
}  // namespace backsim
