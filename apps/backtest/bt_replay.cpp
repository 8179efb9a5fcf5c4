#include <csignal>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include "backsim/backtest/backtest_csv_exporter.hpp"
#include "backsim/backtest/backtest_runner.hpp"
#include "backsim/backtest/result_serialization.hpp"
#include "backsim/core/logger.hpp"
#include "backsim/data/candle_csv_loader.hpp"

using namespace backsim;
using namespace backsim::backtest;

namespace {

CancellationToken g_cancellation;

void handle_interrupt(int) {
    g_cancellation.cancel();
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <config.json> <candles.csv> [output_dir]" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 4) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string config_path = argv[1];
    const std::string candles_path = argv[2];
    const std::string output_dir = argc == 4 ? argv[3] : "";

    try {
        Logger::reset_for_tests();

        // Initialize logger
        auto& logger = Logger::instance();
        LoggerConfig logger_config;
        logger_config.min_level = LogLevel::INFO;
        logger_config.destination = LogDestination::CONSOLE;
        logger_config.filename_prefix = "bt_replay";
        logger.initialize(logger_config);

        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }

        // Configure backtest parameters
        INFO("Loading configuration from " << config_path);
        BacktestConfig config;
        auto load_result = config.load_from_file(config_path);
        if (load_result.is_error()) {
            std::cerr << "Failed to load config: " << load_result.error()->to_string()
                      << std::endl;
            return 1;
        }

        CandleCsvLoader loader(config.symbol, config.timeframe);
        auto series = loader.load_file(candles_path);
        if (series.is_error()) {
            std::cerr << "Failed to load candles: " << series.error()->to_string() << std::endl;
            return 1;
        }
        INFO("Loaded " << series.value().size() << " candles from " << candles_path);

        auto runner = BacktestRunner::create(config);
        if (runner.is_error()) {
            std::cerr << "Failed to create backtest: " << runner.error()->to_string()
                      << std::endl;
            return 1;
        }

        std::signal(SIGINT, handle_interrupt);

        auto progress = [](const BacktestProgress& p) {
            INFO("Progress " << std::fixed << std::setprecision(1) << p.percent_complete << "% ("
                             << p.candles_processed << "/" << p.total_candles
                             << "), equity " << std::setprecision(2) << p.equity);
        };

        auto result = runner.value()->run(series.value(), progress, &g_cancellation);
        if (result.is_error()) {
            std::cerr << "Backtest failed: " << result.error()->to_string() << std::endl;
            return 1;
        }

        const BacktestResult& backtest = result.value();
        if (backtest.is_partial()) {
            WARN("Backtest was cancelled; results are partial");
        }

        std::cout << to_json(backtest, false).dump(4) << std::endl;

        if (!output_dir.empty()) {
            BacktestCSVExporter exporter(output_dir);
            auto export_result = exporter.export_result(backtest);
            if (export_result.is_error()) {
                std::cerr << "Failed to export results: "
                          << export_result.error()->to_string() << std::endl;
                return 1;
            }

            std::ofstream summary(std::filesystem::path(output_dir) / "result.json");
            if (!summary.is_open()) {
                std::cerr << "Failed to write result.json to " << output_dir << std::endl;
                return 1;
            }
            summary << std::setw(4) << to_json(backtest) << std::endl;
            INFO("Results written to " << output_dir);
        }

        return backtest.is_partial() ? 2 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
