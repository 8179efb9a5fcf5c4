#include <gtest/gtest.h>
#include <cmath>
#include "../core/test_base.hpp"
#include "backsim/backtest/results_aggregator.hpp"
#include "test_utils.hpp"

using namespace backsim;
using namespace backsim::backtest;
using backsim::testing::day;

namespace {

Trade make_trade(double pnl, int64_t duration = 86400, double commission = 1.0) {
    Trade trade;
    trade.pnl = pnl;
    trade.duration_seconds = duration;
    trade.commission = commission;
    return trade;
}

}  // namespace

class ResultsAggregatorTest : public backsim::testing::TestBase {
protected:
    ResultsAggregator aggregator_;
};

TEST_F(ResultsAggregatorTest, EmptyLedger) {
    auto stats = aggregator_.calculate_trade_statistics({});
    EXPECT_EQ(stats.total_trades, 0);
    EXPECT_DOUBLE_EQ(stats.win_rate, 0.0);
    EXPECT_DOUBLE_EQ(stats.average_trade, 0.0);
    EXPECT_DOUBLE_EQ(stats.best_trade, 0.0);
    EXPECT_DOUBLE_EQ(stats.worst_trade, 0.0);
    EXPECT_DOUBLE_EQ(stats.profit_factor, 0.0);
}

TEST_F(ResultsAggregatorTest, TradeStatistics) {
    std::vector<Trade> trades = {make_trade(100.0, 86400), make_trade(-50.0, 172800),
                                 make_trade(0.0, 86400), make_trade(25.0, 86400)};
    auto stats = aggregator_.calculate_trade_statistics(trades);

    EXPECT_EQ(stats.total_trades, 4);
    EXPECT_EQ(stats.winning_trades, 2);
    EXPECT_EQ(stats.losing_trades, 1);
    EXPECT_DOUBLE_EQ(stats.win_rate, 50.0);
    EXPECT_DOUBLE_EQ(stats.average_trade, 18.75);
    EXPECT_DOUBLE_EQ(stats.best_trade, 100.0);
    EXPECT_DOUBLE_EQ(stats.worst_trade, -50.0);
    EXPECT_DOUBLE_EQ(stats.profit_factor, 2.5);
    EXPECT_DOUBLE_EQ(stats.average_win, 62.5);
    EXPECT_DOUBLE_EQ(stats.average_loss, -50.0);
    EXPECT_DOUBLE_EQ(stats.average_duration_seconds, 108000.0);
    EXPECT_DOUBLE_EQ(stats.total_commission, 4.0);
}

TEST_F(ResultsAggregatorTest, ProfitFactorWithoutLosses) {
    auto stats = aggregator_.calculate_trade_statistics({make_trade(10.0), make_trade(20.0)});
    EXPECT_DOUBLE_EQ(stats.profit_factor, 999.0);
    EXPECT_DOUBLE_EQ(stats.win_rate, 100.0);

    auto losers = aggregator_.calculate_trade_statistics({make_trade(-10.0)});
    EXPECT_DOUBLE_EQ(losers.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(losers.win_rate, 0.0);
}

TEST_F(ResultsAggregatorTest, TotalReturn) {
    EXPECT_DOUBLE_EQ(aggregator_.calculate_total_return_percent(10000.0, 11000.0), 10.0);
    EXPECT_DOUBLE_EQ(aggregator_.calculate_total_return_percent(10000.0, 9000.0), -10.0);
    EXPECT_DOUBLE_EQ(aggregator_.calculate_total_return_percent(0.0, 100.0), 0.0);
}

TEST_F(ResultsAggregatorTest, ReturnsStartFromInitialBalance) {
    std::vector<EquityPoint> curve = {{day(0), 110.0}, {day(1), 99.0}};
    auto returns = aggregator_.calculate_returns(100.0, curve);
    ASSERT_EQ(returns.size(), 2u);
    EXPECT_NEAR(returns[0], 0.1, 1e-12);
    EXPECT_NEAR(returns[1], -0.1, 1e-12);
}

TEST_F(ResultsAggregatorTest, SharpeRatio) {
    EXPECT_NEAR(aggregator_.calculate_sharpe_ratio({0.01, 0.03}, 252.0), 2.0 * std::sqrt(252.0),
                1e-9);
    EXPECT_DOUBLE_EQ(aggregator_.calculate_sharpe_ratio({0.01}, 252.0), 0.0);
    EXPECT_DOUBLE_EQ(aggregator_.calculate_sharpe_ratio({0.01, 0.01}, 252.0), 0.0);
    EXPECT_DOUBLE_EQ(aggregator_.calculate_sharpe_ratio({}, 252.0), 0.0);
}

TEST_F(ResultsAggregatorTest, SortinoRatio) {
    EXPECT_NEAR(aggregator_.calculate_sortino_ratio({0.02, -0.01}, 1.0), std::sqrt(0.5), 1e-9);
    EXPECT_DOUBLE_EQ(aggregator_.calculate_sortino_ratio({0.01, 0.02}, 252.0), 999.0);
    EXPECT_DOUBLE_EQ(aggregator_.calculate_sortino_ratio({0.0, 0.0}, 252.0), 0.0);
    EXPECT_DOUBLE_EQ(aggregator_.calculate_sortino_ratio({0.01}, 252.0), 0.0);
}

TEST_F(ResultsAggregatorTest, PopulateKeepsDrawdown) {
    BacktestResult result;
    result.initial_balance = 1000.0;
    result.final_balance = 1100.0;
    result.max_drawdown_percent = 7.5;
    result.trades = {make_trade(100.0)};
    result.equity_curve = {{day(0), 1000.0}, {day(1), 1050.0}, {day(2), 1100.0}};

    aggregator_.populate(result, Timeframe::DAILY);
    EXPECT_DOUBLE_EQ(result.total_return_percent, 10.0);
    EXPECT_EQ(result.total_trades, 1);
    EXPECT_DOUBLE_EQ(result.win_rate, 100.0);
    EXPECT_DOUBLE_EQ(result.max_drawdown_percent, 7.5);
    EXPECT_GT(result.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(result.sortino_ratio, 999.0);
}
