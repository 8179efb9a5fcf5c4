// include/backsim/backtest/types.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "backsim/core/types.hpp"

namespace backsim {
namespace backtest {

enum class ExitReason {
    SIGNAL,
    STOP_LOSS,
    TAKE_PROFIT
};

inline std::string exit_reason_to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::SIGNAL:
            return "signal";
        case ExitReason::STOP_LOSS:
            return "stop_loss";
        case ExitReason::TAKE_PROFIT:
            return "take_profit";
        default:
            return "unknown";
    }
}

/**
 * @brief A closed round trip
 *
 * `pnl` is net of entry and exit commission;
 * `pnl_percent = pnl / (entry_price * quantity) * 100`.
 */
struct Trade {
    PositionSide side{PositionSide::LONG};
    Timestamp entry_timestamp;
    Timestamp exit_timestamp;
    Price entry_price{0.0};
    Price exit_price{0.0};
    Quantity quantity{0.0};
    double pnl{0.0};
    double pnl_percent{0.0};
    ExitReason exit_reason{ExitReason::SIGNAL};
    int64_t duration_seconds{0};
    double commission{0.0};
};

/**
 * @brief Mark-to-market account value after a candle
 */
struct EquityPoint {
    Timestamp timestamp;
    double equity{0.0};
};

enum class RunStatus {
    COMPLETED,
    CANCELLED  // partial: only the candles before cancellation were processed
};

inline std::string run_status_to_string(RunStatus status) {
    return status == RunStatus::COMPLETED ? "completed" : "cancelled";
}

/**
 * @brief Outcome of one run
 */
struct BacktestResult {
    RunStatus status{RunStatus::COMPLETED};
    std::string symbol;
    std::string strategy_id;

    double initial_balance{0.0};
    double final_balance{0.0};
    double total_return_percent{0.0};

    std::vector<Trade> trades;
    std::vector<EquityPoint> equity_curve;

    // Trade statistics
    double win_rate{0.0};  // percent
    double average_trade{0.0};
    double best_trade{0.0};
    double worst_trade{0.0};
    int total_trades{0};
    int winning_trades{0};
    int losing_trades{0};
    double profit_factor{0.0};
    double average_win{0.0};
    double average_loss{0.0};
    double average_trade_duration_seconds{0.0};
    double total_commission{0.0};

    // Risk metrics
    double max_drawdown_percent{0.0};
    double sharpe_ratio{0.0};
    double sortino_ratio{0.0};

    // Position still open after the last processed candle
    std::optional<Position> open_position;
    double unrealized_pnl{0.0};

    size_t candles_processed{0};
    size_t total_candles{0};

    bool is_partial() const {
        return status == RunStatus::CANCELLED;
    }
};

/**
 * @brief Snapshot handed to progress observers
 */
struct BacktestProgress {
    size_t candles_processed{0};
    size_t total_candles{0};
    double percent_complete{0.0};
    Timestamp current_timestamp;
    double equity{0.0};
};

using ProgressCallback = std::function<void(const BacktestProgress&)>;

/**
 * @brief Cooperative cancellation flag checked at every candle boundary
 *
 * Safe to cancel from any thread while a run is in progress.
 */
class CancellationToken {
public:
    void cancel() {
        cancelled_.store(true, std::memory_order_release);
    }

    bool is_cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    void reset() {
        cancelled_.store(false, std::memory_order_release);
    }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace backtest
}  // namespace backsim
