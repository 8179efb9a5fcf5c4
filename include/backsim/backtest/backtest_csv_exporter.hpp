// include/backsim/backtest/backtest_csv_exporter.hpp
#pragma once

#include <fstream>
#include <string>
#include <vector>
#include "backsim/backtest/types.hpp"
#include "backsim/core/error.hpp"

namespace backsim {
namespace backtest {

/**
 * @brief Writes trades.csv and equity_curve.csv for a finished run
 */
class BacktestCSVExporter {
public:
    explicit BacktestCSVExporter(const std::string& output_directory);
    ~BacktestCSVExporter();

    /**
     * @brief Create the output directory and both files with their headers
     */
    Result<void> initialize_files();

    Result<void> append_trades(const std::vector<Trade>& trades);
    Result<void> append_equity_curve(const std::vector<EquityPoint>& curve);

    /**
     * @brief initialize_files, write the whole result, finalize
     */
    Result<void> export_result(const BacktestResult& result);

    void finalize();

    const std::string& output_directory() const {
        return output_directory_;
    }

private:
    std::string output_directory_;
    std::ofstream trades_file_;
    std::ofstream equity_file_;
};

}  // namespace backtest
}  // namespace backsim
