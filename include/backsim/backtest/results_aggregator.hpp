// include/backsim/backtest/results_aggregator.hpp
#pragma once

#include <vector>
#include "backsim/backtest/types.hpp"
#include "backsim/core/types.hpp"

namespace backsim {
namespace backtest {

/**
 * @brief Pure stateless calculation of run metrics
 *
 * All methods are const with no side effects and no logging; the runner
 * is responsible for reporting.
 */
class ResultsAggregator {
public:
    /**
     * @brief Trade ledger statistics
     */
    struct TradeStatistics {
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;  // percent
        double average_trade = 0.0;
        double best_trade = 0.0;
        double worst_trade = 0.0;
        double gross_profit = 0.0;
        double gross_loss = 0.0;  // positive magnitude
        double profit_factor = 0.0;
        double average_win = 0.0;
        double average_loss = 0.0;  // negative or zero
        double average_duration_seconds = 0.0;
        double total_commission = 0.0;
    };

    TradeStatistics calculate_trade_statistics(const std::vector<Trade>& trades) const;

    /**
     * @brief Return as percent of the starting value; 0 if start <= 0
     */
    double calculate_total_return_percent(double start_value, double end_value) const;

    /**
     * @brief Per-candle simple returns, the first one relative to `initial_balance`
     */
    std::vector<double> calculate_returns(double initial_balance,
                                          const std::vector<EquityPoint>& curve) const;

    /**
     * @brief Annualized Sharpe ratio with a zero risk-free rate
     * @return 0 for fewer than two returns or zero volatility
     */
    double calculate_sharpe_ratio(const std::vector<double>& returns,
                                  double periods_per_year) const;

    /**
     * @brief Annualized Sortino ratio against a zero target
     * @return 999 when there is no downside and the mean is positive
     */
    double calculate_sortino_ratio(const std::vector<double>& returns,
                                   double periods_per_year) const;

    /**
     * @brief Fill every derived metric of `result`
     *
     * Expects trades, equity curve, initial and final balance to be set;
     * max drawdown comes from the equity tracker and is left untouched.
     */
    void populate(BacktestResult& result, Timeframe timeframe) const;

private:
    double calculate_mean(const std::vector<double>& values) const;
};

}  // namespace backtest
}  // namespace backsim
