// src/backtest/backtest_csv_exporter.cpp
#include "backsim/backtest/backtest_csv_exporter.hpp"
#include <filesystem>
#include <iomanip>
#include "backsim/core/logger.hpp"
#include "backsim/core/time_utils.hpp"

namespace backsim {
namespace backtest {

BacktestCSVExporter::BacktestCSVExporter(const std::string& output_directory)
    : output_directory_(output_directory) {}

BacktestCSVExporter::~BacktestCSVExporter() {
    finalize();
}

Result<void> BacktestCSVExporter::initialize_files() {
    try {
        std::filesystem::create_directories(output_directory_);

        trades_file_.open(std::filesystem::path(output_directory_) / "trades.csv");
        if (!trades_file_.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open trades.csv for writing",
                                    "BacktestCSVExporter");
        }
        trades_file_ << "side,entry_time,exit_time,entry_price,exit_price,quantity,pnl,"
                     << "pnl_percent,exit_reason,duration_seconds,commission\n";

        equity_file_.open(std::filesystem::path(output_directory_) / "equity_curve.csv");
        if (!equity_file_.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open equity_curve.csv for writing",
                                    "BacktestCSVExporter");
        }
        equity_file_ << "timestamp,equity\n";

        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error initializing CSV files: ") + e.what(),
                                "BacktestCSVExporter");
    }
}

Result<void> BacktestCSVExporter::append_trades(const std::vector<Trade>& trades) {
    if (!trades_file_.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "trades.csv file is not open",
                                "BacktestCSVExporter");
    }

    trades_file_ << std::fixed << std::setprecision(6);
    for (const auto& trade : trades) {
        trades_file_ << side_to_string(trade.side) << ","
                     << core::format_utc(trade.entry_timestamp) << ","
                     << core::format_utc(trade.exit_timestamp) << "," << trade.entry_price
                     << "," << trade.exit_price << "," << trade.quantity << "," << trade.pnl
                     << "," << trade.pnl_percent << "," << exit_reason_to_string(trade.exit_reason)
                     << "," << trade.duration_seconds << "," << trade.commission << "\n";
    }

    if (!trades_file_) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing trades.csv",
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::append_equity_curve(const std::vector<EquityPoint>& curve) {
    if (!equity_file_.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "equity_curve.csv file is not open",
                                "BacktestCSVExporter");
    }

    equity_file_ << std::fixed << std::setprecision(6);
    for (const auto& point : curve) {
        equity_file_ << core::format_utc(point.timestamp) << "," << point.equity << "\n";
    }

    if (!equity_file_) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing equity_curve.csv",
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_result(const BacktestResult& result) {
    auto init = initialize_files();
    if (init.is_error()) {
        return init;
    }

    auto trades = append_trades(result.trades);
    if (trades.is_error()) {
        return trades;
    }

    auto equity = append_equity_curve(result.equity_curve);
    if (equity.is_error()) {
        return equity;
    }

    finalize();
    INFO("Exported " << result.trades.size() << " trades and " << result.equity_curve.size()
                     << " equity points to " << output_directory_);
    return Result<void>();
}

void BacktestCSVExporter::finalize() {
    if (trades_file_.is_open()) {
        trades_file_.close();
    }
    if (equity_file_.is_open()) {
        equity_file_.close();
    }
}

}  // namespace backtest
}  // namespace backsim
