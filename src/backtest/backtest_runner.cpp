// src/backtest/backtest_runner.cpp
#include "backsim/backtest/backtest_runner.hpp"
#include <algorithm>
#include <cmath>
#include "backsim/core/logger.hpp"
#include "backsim/core/time_utils.hpp"

namespace backsim {
namespace backtest {

namespace {
constexpr size_t TARGET_PROGRESS_REPORTS = 100;
}

BacktestRunner::BacktestRunner(BacktestConfig config,
                               std::shared_ptr<const StrategyInterface> strategy)
    : config_(std::move(config)), strategy_(std::move(strategy)) {}

Result<std::unique_ptr<BacktestRunner>> BacktestRunner::create(const BacktestConfig& config,
                                                               const StrategyRegistry& registry) {
    auto valid = config.validate();
    if (valid.is_error()) {
        return make_error<std::unique_ptr<BacktestRunner>>(valid.error()->code(),
                                                           valid.error()->what(),
                                                           "BacktestRunner");
    }

    auto strategy = registry.create(config.strategy_id, config.strategy_params);
    if (strategy.is_error()) {
        return make_error<std::unique_ptr<BacktestRunner>>(strategy.error()->code(),
                                                           strategy.error()->what(),
                                                           "BacktestRunner");
    }

    std::shared_ptr<const StrategyInterface> shared(strategy.take_value());
    return Result<std::unique_ptr<BacktestRunner>>(
        std::make_unique<BacktestRunner>(config, std::move(shared)));
}

size_t BacktestRunner::progress_interval(size_t total_candles) const {
    if (config_.progress_interval > 0) {
        return static_cast<size_t>(config_.progress_interval);
    }
    return std::max<size_t>(1, total_candles / TARGET_PROGRESS_REPORTS);
}

Result<BacktestResult> BacktestRunner::run(const CandleSeries& series,
                                           const ProgressCallback& progress,
                                           const CancellationToken* cancellation) const {
    Logger::register_component("BacktestRunner");

    if (!strategy_) {
        return make_error<BacktestResult>(ErrorCode::NOT_INITIALIZED,
                                          "Runner has no strategy", "BacktestRunner");
    }

    auto config_valid = config_.validate();
    if (config_valid.is_error()) {
        ERROR("Invalid backtest config: " << config_valid.error()->what());
        return make_error<BacktestResult>(config_valid.error()->code(),
                                          config_valid.error()->what(), "BacktestRunner");
    }

    auto data_valid = series.validate();
    if (data_valid.is_error()) {
        ERROR("Invalid candle data for " << series.symbol() << ": "
                                         << data_valid.error()->what());
        return make_error<BacktestResult>(data_valid.error()->code(),
                                          data_valid.error()->what(), "BacktestRunner");
    }

    if (!series.symbol().empty() && series.symbol() != config_.symbol) {
        WARN("Series symbol " << series.symbol() << " differs from configured symbol "
                              << config_.symbol);
    }

    CandleSeries window = series.slice(config_.start_time, config_.end_time);
    if (window.size() < series.size()) {
        DEBUG("Dropped " << (series.size() - window.size())
                         << " candles outside the configured window");
    }

    auto indicators = IndicatorSet::create(strategy_->required_indicators());
    if (indicators.is_error()) {
        return make_error<BacktestResult>(indicators.error()->code(),
                                          indicators.error()->what(), "BacktestRunner");
    }

    RunState state(config_, indicators.take_value());
    const size_t total = window.size();
    const size_t interval = progress_interval(total);
    RunStatus status = RunStatus::COMPLETED;

    INFO("Starting backtest of " << strategy_->metadata().id << " on " << config_.symbol << " ("
                                 << timeframe_to_string(config_.timeframe) << ", " << total
                                 << " candles)");

    for (const auto& candle : window.candles()) {
        if (cancellation && cancellation->is_cancelled()) {
            status = RunStatus::CANCELLED;
            INFO("Backtest cancelled after " << state.candles_processed << " of " << total
                                             << " candles");
            break;
        }

        process_candle(state, candle);

        if (progress &&
            (state.candles_processed % interval == 0 || state.candles_processed == total)) {
            BacktestProgress report;
            report.candles_processed = state.candles_processed;
            report.total_candles = total;
            report.percent_complete =
                static_cast<double>(state.candles_processed) / static_cast<double>(total) * 100.0;
            report.current_timestamp = candle.timestamp;
            report.equity = state.equity.last_equity();
            progress(report);
        }
    }

    BacktestResult result = build_result(state, total, status);

    INFO("Backtest finished: " << result.total_trades << " trades, final balance "
                               << result.final_balance << ", return "
                               << result.total_return_percent << "%, max drawdown "
                               << result.max_drawdown_percent << "%");
    return Result<BacktestResult>(std::move(result));
}

void BacktestRunner::process_candle(RunState& state, const Candle& candle) const {
    const IndicatorValues& values = state.indicators.update(candle);
    PositionManager& positions = state.positions;

    bool exited_on_risk = false;
    if (positions.is_open()) {
        auto risk_exit = positions.risk().check(*positions.position(), candle);
        if (risk_exit) {
            positions.close_at(risk_exit->price, candle.timestamp, risk_exit->reason);
            exited_on_risk = true;
        }
    }

    if (!exited_on_risk) {
        StrategySignal signal = strategy_->evaluate(candle, values, positions.position());
        if (positions.is_open()) {
            if (signal.exit) {
                positions.close_on_signal(candle);
            }
        } else if (signal.enter) {
            positions.open(signal.side, candle);
        }
    }

    state.equity.record(candle.timestamp, positions.equity(candle.close));
    state.candles_processed++;
    state.last_candle = &candle;
}

BacktestResult BacktestRunner::build_result(const RunState& state, size_t total_candles,
                                            RunStatus status) const {
    BacktestResult result;
    result.status = status;
    result.symbol = config_.symbol;
    result.strategy_id = strategy_->metadata().id;
    result.initial_balance = config_.initial_balance;
    result.trades = state.positions.trades();
    result.equity_curve = state.equity.curve();
    result.max_drawdown_percent = state.equity.max_drawdown_percent();
    result.candles_processed = state.candles_processed;
    result.total_candles = total_candles;

    if (state.last_candle) {
        result.final_balance = state.positions.equity(state.last_candle->close);
        result.open_position = state.positions.position();
        result.unrealized_pnl = state.positions.unrealized_pnl(state.last_candle->close);
    } else {
        result.final_balance = state.positions.cash();
    }

    aggregator_.populate(result, config_.timeframe);
    return result;
}

std::future<Result<BacktestResult>> BacktestRunner::run_async(
    CandleSeries series, ProgressCallback progress,
    std::shared_ptr<CancellationToken> cancellation) const {
    BacktestRunner runner(*this);
    return std::async(std::launch::async,
                      [runner = std::move(runner), series = std::move(series),
                       progress = std::move(progress), cancellation = std::move(cancellation)]() {
                          return runner.run(series, progress, cancellation.get());
                      });
}

Result<void> BacktestRunner::close_open_position(BacktestResult& result, Price exit_price,
                                                 Timestamp exit_timestamp) const {
    if (!result.open_position) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Result has no open position",
                                "BacktestRunner");
    }
    if (!std::isfinite(exit_price) || exit_price <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Exit price must be positive to close a position",
                                "BacktestRunner");
    }

    Trade trade = close_trade(*result.open_position, exit_price, exit_timestamp,
                              ExitReason::SIGNAL, config_.commission_percent);

    result.final_balance += trade.pnl - result.unrealized_pnl;
    result.trades.push_back(trade);
    result.open_position.reset();
    result.unrealized_pnl = 0.0;
    aggregator_.populate(result, config_.timeframe);

    INFO("Force-closed " << side_to_string(trade.side) << " position at " << exit_price
                         << " (" << core::format_utc(exit_timestamp) << "), pnl " << trade.pnl);
    return Result<void>();
}

}  // namespace backtest
}  // namespace backsim
