// include/backsim/backtest/backtest_runner.hpp
#pragma once

#include <future>
#include <memory>
#include "backsim/backtest/backtest_config.hpp"
#include "backsim/backtest/results_aggregator.hpp"
#include "backsim/backtest/run_state.hpp"
#include "backsim/backtest/types.hpp"
#include "backsim/core/error.hpp"
#include "backsim/data/candle_series.hpp"
#include "backsim/strategy/strategy_interface.hpp"
#include "backsim/strategy/strategy_registry.hpp"

namespace backsim {
namespace backtest {

/**
 * @brief Replays a candle series through one strategy
 *
 * Per candle, strictly in order: cancellation check, indicator update,
 * stop-loss / take-profit check, strategy evaluation (skipped when a risk
 * exit fired), position transition, equity update, progress report.
 *
 * The runner itself is immutable; every run builds a fresh RunState, so one
 * runner may serve several runs, including concurrent ones.
 */
class BacktestRunner {
public:
    BacktestRunner(BacktestConfig config, std::shared_ptr<const StrategyInterface> strategy);

    /**
     * @brief Instantiate `config.strategy_id` from the registry
     * @return INVALID_CONFIG for a bad config or bad strategy parameters,
     *         UNKNOWN_STRATEGY for an unregistered id
     */
    static Result<std::unique_ptr<BacktestRunner>> create(
        const BacktestConfig& config,
        const StrategyRegistry& registry = StrategyRegistry::instance());

    /**
     * @brief Run the backtest synchronously
     * @param series Candles; only those in [start_time, end_time] are replayed
     * @param progress Optional observer, called every `progress_interval`
     *        candles and after the final candle
     * @param cancellation Optional token; when set, the run stops at the next
     *        candle boundary and returns a CANCELLED partial result
     * @return INVALID_CONFIG or INVALID_DATA before any candle is processed;
     *         otherwise a result. An open position is left open.
     */
    Result<BacktestResult> run(const CandleSeries& series,
                               const ProgressCallback& progress = nullptr,
                               const CancellationToken* cancellation = nullptr) const;

    /**
     * @brief Run on a background thread
     *
     * The series is copied into the task; the token, if any, is shared with
     * the caller so it can cancel.
     */
    std::future<Result<BacktestResult>> run_async(
        CandleSeries series, ProgressCallback progress = nullptr,
        std::shared_ptr<CancellationToken> cancellation = nullptr) const;

    /**
     * @brief Close the open position of a finished result at `exit_price`
     *
     * Appends a SIGNAL trade (commission applies, slippage does not), clears
     * the open position and recomputes the statistics. The equity curve and
     * max drawdown are left as recorded.
     * @return INVALID_ARGUMENT if there is no open position or the price is
     *         not positive
     */
    Result<void> close_open_position(BacktestResult& result, Price exit_price,
                                     Timestamp exit_timestamp) const;

    const BacktestConfig& config() const {
        return config_;
    }

    const StrategyInterface& strategy() const {
        return *strategy_;
    }

private:
    void process_candle(RunState& state, const Candle& candle) const;
    size_t progress_interval(size_t total_candles) const;
    BacktestResult build_result(const RunState& state, size_t total_candles,
                                RunStatus status) const;

    BacktestConfig config_;
    std::shared_ptr<const StrategyInterface> strategy_;
    ResultsAggregator aggregator_;
};

}  // namespace backtest
}  // namespace backsim
