// src/backtest/parameter_sweep.cpp
#include "backsim/backtest/parameter_sweep.hpp"
#include <algorithm>
#include <atomic>
#include <future>
#include <thread>
#include "backsim/backtest/backtest_runner.hpp"
#include "backsim/core/logger.hpp"

namespace backsim {
namespace backtest {

ParameterSweep::ParameterSweep(const StrategyRegistry& registry) : registry_(registry) {}

std::vector<BacktestConfig> ParameterSweep::expand_grid(const BacktestConfig& base,
                                                        const std::string& param_name,
                                                        const std::vector<double>& values) {
    std::vector<BacktestConfig> configs;
    configs.reserve(values.size());
    for (double value : values) {
        BacktestConfig config = base;
        config.strategy_params[param_name] = value;
        configs.push_back(config);
    }
    return configs;
}

SweepOutcome ParameterSweep::run_one(const BacktestConfig& config, const CandleSeries& series,
                                     const CancellationToken* cancellation) const {
    SweepOutcome outcome;
    outcome.config = config;

    auto runner = BacktestRunner::create(config, registry_);
    if (runner.is_error()) {
        outcome.error_code = runner.error()->code();
        outcome.error = runner.error()->what();
        return outcome;
    }

    auto result = runner.value()->run(series, nullptr, cancellation);
    if (result.is_error()) {
        outcome.error_code = result.error()->code();
        outcome.error = result.error()->what();
        return outcome;
    }

    outcome.ok = true;
    outcome.result = result.take_value();
    return outcome;
}

std::vector<SweepOutcome> ParameterSweep::run(const std::vector<BacktestConfig>& configs,
                                              const CandleSeries& series, size_t max_workers,
                                              const CancellationToken* cancellation) const {
    std::vector<SweepOutcome> outcomes(configs.size());
    if (configs.empty()) {
        return outcomes;
    }

    size_t workers = max_workers;
    if (workers == 0) {
        workers = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    workers = std::min(workers, configs.size());

    INFO("Running parameter sweep of " << configs.size() << " configurations on " << workers
                                       << " workers");

    std::atomic<size_t> next_index{0};
    auto worker = [&]() {
        for (size_t i = next_index.fetch_add(1); i < configs.size();
             i = next_index.fetch_add(1)) {
            try {
                outcomes[i] = run_one(configs[i], series, cancellation);
            } catch (const std::exception& e) {
                outcomes[i].config = configs[i];
                outcomes[i].ok = false;
                outcomes[i].error_code = ErrorCode::UNKNOWN_ERROR;
                outcomes[i].error = e.what();
                ERROR("Sweep configuration " << i << " failed: " << e.what());
            }
        }
    };

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, worker));
    }
    for (auto& future : futures) {
        future.get();
    }

    size_t failed = static_cast<size_t>(std::count_if(
        outcomes.begin(), outcomes.end(), [](const SweepOutcome& o) { return !o.ok; }));
    if (failed > 0) {
        WARN(failed << " of " << configs.size() << " sweep configurations failed");
    }
    return outcomes;
}

}  // namespace backtest
}  // namespace backsim
