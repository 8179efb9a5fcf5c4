// src/backtest/results_aggregator.cpp
#include "backsim/backtest/results_aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace backsim {
namespace backtest {

namespace {
constexpr double UNBOUNDED_RATIO = 999.0;
}

double ResultsAggregator::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

ResultsAggregator::TradeStatistics ResultsAggregator::calculate_trade_statistics(
    const std::vector<Trade>& trades) const {
    TradeStatistics stats;
    if (trades.empty()) {
        return stats;
    }

    double total_pnl = 0.0;
    double total_duration = 0.0;
    stats.best_trade = trades.front().pnl;
    stats.worst_trade = trades.front().pnl;

    for (const auto& trade : trades) {
        total_pnl += trade.pnl;
        total_duration += static_cast<double>(trade.duration_seconds);
        stats.total_commission += trade.commission;
        stats.best_trade = std::max(stats.best_trade, trade.pnl);
        stats.worst_trade = std::min(stats.worst_trade, trade.pnl);

        if (trade.pnl > 0.0) {
            stats.winning_trades++;
            stats.gross_profit += trade.pnl;
        } else if (trade.pnl < 0.0) {
            stats.losing_trades++;
            stats.gross_loss += -trade.pnl;
        }
    }

    stats.total_trades = static_cast<int>(trades.size());
    double count = static_cast<double>(trades.size());
    stats.win_rate = static_cast<double>(stats.winning_trades) / count * 100.0;
    stats.average_trade = total_pnl / count;
    stats.average_duration_seconds = total_duration / count;

    if (stats.winning_trades > 0) {
        stats.average_win = stats.gross_profit / stats.winning_trades;
    }
    if (stats.losing_trades > 0) {
        stats.average_loss = -stats.gross_loss / stats.losing_trades;
    }

    if (stats.gross_loss > 0.0) {
        stats.profit_factor = stats.gross_profit / stats.gross_loss;
    } else if (stats.gross_profit > 0.0) {
        stats.profit_factor = UNBOUNDED_RATIO;
    }

    return stats;
}

double ResultsAggregator::calculate_total_return_percent(double start_value,
                                                         double end_value) const {
    if (start_value <= 0.0) {
        return 0.0;
    }
    return (end_value - start_value) / start_value * 100.0;
}

std::vector<double> ResultsAggregator::calculate_returns(
    double initial_balance, const std::vector<EquityPoint>& curve) const {
    std::vector<double> returns;
    returns.reserve(curve.size());

    double previous = initial_balance;
    for (const auto& point : curve) {
        if (previous > 0.0) {
            returns.push_back((point.equity - previous) / previous);
        }
        previous = point.equity;
    }
    return returns;
}

double ResultsAggregator::calculate_sharpe_ratio(const std::vector<double>& returns,
                                                 double periods_per_year) const {
    if (returns.size() < 2 || periods_per_year <= 0.0) {
        return 0.0;
    }

    double mean_return = calculate_mean(returns);
    double sq_sum = 0.0;
    for (double r : returns) {
        sq_sum += (r - mean_return) * (r - mean_return);
    }
    double stddev = std::sqrt(sq_sum / static_cast<double>(returns.size()));
    if (stddev <= 0.0) {
        return 0.0;
    }

    return mean_return / stddev * std::sqrt(periods_per_year);
}

double ResultsAggregator::calculate_sortino_ratio(const std::vector<double>& returns,
                                                  double periods_per_year) const {
    if (returns.size() < 2 || periods_per_year <= 0.0) {
        return 0.0;
    }

    double mean_return = calculate_mean(returns);
    double downside_sq = 0.0;
    for (double r : returns) {
        if (r < 0.0) {
            downside_sq += r * r;
        }
    }
    double downside_dev = std::sqrt(downside_sq / static_cast<double>(returns.size()));

    if (downside_dev <= 0.0) {
        // No negative returns - cap at reasonable value
        return mean_return > 0.0 ? UNBOUNDED_RATIO : 0.0;
    }
    return mean_return / downside_dev * std::sqrt(periods_per_year);
}

void ResultsAggregator::populate(BacktestResult& result, Timeframe timeframe) const {
    auto stats = calculate_trade_statistics(result.trades);
    result.total_trades = stats.total_trades;
    result.winning_trades = stats.winning_trades;
    result.losing_trades = stats.losing_trades;
    result.win_rate = stats.win_rate;
    result.average_trade = stats.average_trade;
    result.best_trade = stats.best_trade;
    result.worst_trade = stats.worst_trade;
    result.profit_factor = stats.profit_factor;
    result.average_win = stats.average_win;
    result.average_loss = stats.average_loss;
    result.average_trade_duration_seconds = stats.average_duration_seconds;
    result.total_commission = stats.total_commission;

    result.total_return_percent =
        calculate_total_return_percent(result.initial_balance, result.final_balance);

    auto returns = calculate_returns(result.initial_balance, result.equity_curve);
    double annualization = periods_per_year(timeframe);
    result.sharpe_ratio = calculate_sharpe_ratio(returns, annualization);
    result.sortino_ratio = calculate_sortino_ratio(returns, annualization);
}

}  // namespace backtest
}  // namespace backsim
