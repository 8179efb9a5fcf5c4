#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "../core/test_base.hpp"
#include "backsim/backtest/backtest_csv_exporter.hpp"
#include "backsim/backtest/result_serialization.hpp"
#include "test_utils.hpp"

using namespace backsim;
using namespace backsim::backtest;
using backsim::testing::day;

namespace {

BacktestResult sample_result() {
    BacktestResult result;
    result.symbol = "BTCUSD";
    result.strategy_id = "ema_crossover";
    result.initial_balance = 1000.0;
    result.final_balance = 1010.0;
    result.total_return_percent = 1.0;

    Trade trade;
    trade.side = PositionSide::LONG;
    trade.entry_timestamp = day(0);
    trade.exit_timestamp = day(2);
    trade.entry_price = 100.0;
    trade.exit_price = 110.0;
    trade.quantity = 1.0;
    trade.pnl = 10.0;
    trade.pnl_percent = 10.0;
    trade.exit_reason = ExitReason::TAKE_PROFIT;
    trade.duration_seconds = 2 * backsim::testing::SECONDS_PER_DAY;
    result.trades.push_back(trade);

    result.equity_curve = {{day(0), 1000.0}, {day(1), 1005.0}, {day(2), 1010.0}};
    result.candles_processed = 3;
    result.total_candles = 3;
    return result;
}

size_t count_lines(const std::filesystem::path& path) {
    std::ifstream file(path);
    size_t lines = 0;
    std::string line;
    while (std::getline(file, line)) {
        ++lines;
    }
    return lines;
}

}  // namespace

class ResultExportTest : public backsim::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        output_dir_ = std::filesystem::temp_directory_path() / "backsim_result_export_test";
        std::filesystem::remove_all(output_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(output_dir_);
        TestBase::TearDown();
    }

    std::filesystem::path output_dir_;
};

TEST_F(ResultExportTest, TradeJson) {
    auto j = to_json(sample_result().trades[0]);
    EXPECT_EQ(j["side"].get<std::string>(), "long");
    EXPECT_EQ(j["exit_reason"].get<std::string>(), "take_profit");
    EXPECT_EQ(j["entry_timestamp"].get<int64_t>(), backsim::testing::BASE_EPOCH);
    EXPECT_DOUBLE_EQ(j["pnl"].get<double>(), 10.0);
}

TEST_F(ResultExportTest, ResultJson) {
    auto result = sample_result();
    auto j = to_json(result);

    EXPECT_EQ(j["status"].get<std::string>(), "completed");
    EXPECT_EQ(j["strategy_id"].get<std::string>(), "ema_crossover");
    EXPECT_DOUBLE_EQ(j["final_balance"].get<double>(), 1010.0);
    EXPECT_TRUE(j["open_position"].is_null());
    EXPECT_EQ(j["trades"].size(), 1u);
    EXPECT_EQ(j["equity_curve"].size(), 3u);

    auto summary = to_json(result, false);
    EXPECT_FALSE(summary.contains("equity_curve"));
    EXPECT_TRUE(summary.contains("trades"));
}

TEST_F(ResultExportTest, OpenPositionJson) {
    auto result = sample_result();
    Position position;
    position.side = PositionSide::SHORT;
    position.entry_price = 120.0;
    position.quantity = 2.0;
    position.entry_timestamp = day(2);
    result.open_position = position;
    result.status = RunStatus::CANCELLED;

    auto j = to_json(result);
    EXPECT_EQ(j["status"].get<std::string>(), "cancelled");
    ASSERT_TRUE(j["open_position"].is_object());
    EXPECT_EQ(j["open_position"]["side"].get<std::string>(), "short");
    EXPECT_DOUBLE_EQ(j["open_position"]["quantity"].get<double>(), 2.0);
}

TEST_F(ResultExportTest, ExportCsvFiles) {
    BacktestCSVExporter exporter(output_dir_.string());
    auto exported = exporter.export_result(sample_result());
    ASSERT_TRUE(exported.is_ok()) << exported.error()->what();

    EXPECT_EQ(count_lines(output_dir_ / "trades.csv"), 2u);
    EXPECT_EQ(count_lines(output_dir_ / "equity_curve.csv"), 4u);

    std::ifstream trades(output_dir_ / "trades.csv");
    std::string header;
    std::getline(trades, header);
    EXPECT_EQ(header.rfind("side,entry_time,exit_time", 0), 0u);
    std::string row;
    std::getline(trades, row);
    EXPECT_NE(row.find("take_profit"), std::string::npos);
}

TEST_F(ResultExportTest, AppendBeforeInitializeFails) {
    BacktestCSVExporter exporter(output_dir_.string());
    auto result = exporter.append_trades(sample_result().trades);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}

TEST_F(ResultExportTest, UnwritableDirectory) {
    std::filesystem::create_directories(output_dir_);
    auto blocker = output_dir_ / "not_a_directory";
    {
        std::ofstream file(blocker);
        file << "x";
    }

    BacktestCSVExporter exporter((blocker / "nested").string());
    auto result = exporter.initialize_files();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}
