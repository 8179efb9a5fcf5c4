// include/backsim/backtest/parameter_sweep.hpp
#pragma once

#include <string>
#include <vector>
#include "backsim/backtest/backtest_config.hpp"
#include "backsim/backtest/types.hpp"
#include "backsim/core/error.hpp"
#include "backsim/data/candle_series.hpp"
#include "backsim/strategy/strategy_registry.hpp"

namespace backsim {
namespace backtest {

/**
 * @brief Outcome of one configuration in a sweep
 */
struct SweepOutcome {
    BacktestConfig config;
    bool ok{false};
    BacktestResult result;
    ErrorCode error_code{ErrorCode::NONE};
    std::string error;
};

/**
 * @brief Runs many configurations over the same series on a worker pool
 *
 * Every configuration gets its own runner and strategy instance; the only
 * shared input is the read-only candle series.
 */
class ParameterSweep {
public:
    explicit ParameterSweep(const StrategyRegistry& registry = StrategyRegistry::instance());

    /**
     * @brief Run all configurations
     * @param max_workers Upper bound on concurrent runs, 0 for the hardware
     *        concurrency
     * @param cancellation Optional token shared by every run
     * @return One outcome per configuration, in input order
     */
    std::vector<SweepOutcome> run(const std::vector<BacktestConfig>& configs,
                                  const CandleSeries& series, size_t max_workers = 0,
                                  const CancellationToken* cancellation = nullptr) const;

    /**
     * @brief Expand a base config over a grid of one strategy parameter
     */
    static std::vector<BacktestConfig> expand_grid(const BacktestConfig& base,
                                                   const std::string& param_name,
                                                   const std::vector<double>& values);

private:
    SweepOutcome run_one(const BacktestConfig& config, const CandleSeries& series,
                         const CancellationToken* cancellation) const;

    const StrategyRegistry& registry_;
};

}  // namespace backtest
}  // namespace backsim
