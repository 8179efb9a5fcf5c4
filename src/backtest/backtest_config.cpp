// src/backtest/backtest_config.cpp
#include "backsim/backtest/backtest_config.hpp"
#include <cmath>
#include "backsim/core/time_utils.hpp"

namespace backsim {
namespace backtest {

namespace {

bool in_open_range(double value, double low, double high) {
    return std::isfinite(value) && value > low && value < high;
}

Result<void> config_error(const std::string& message) {
    return make_error<void>(ErrorCode::INVALID_CONFIG, message, "BacktestConfig");
}

}  // namespace

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["timeframe"] = timeframe_to_string(timeframe);
    j["start_time"] = core::to_epoch_seconds(start_time);
    j["end_time"] = core::to_epoch_seconds(end_time);
    j["initial_balance"] = initial_balance;
    j["strategy_id"] = strategy_id;

    nlohmann::json params = nlohmann::json::object();
    for (const auto& [name, value] : strategy_params) {
        params[name] = value;
    }
    j["strategy_params"] = params;

    j["position_size_percent"] = position_size_percent;
    j["stop_loss_percent"] = stop_loss_percent;
    j["take_profit_percent"] = take_profit_percent;
    j["commission_percent"] = commission_percent;
    j["slippage_percent"] = slippage_percent;
    j["progress_interval"] = progress_interval;
    j["version"] = version;
    return j;
}

void BacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("symbol"))
        symbol = j.at("symbol").get<std::string>();
    if (j.contains("timeframe")) {
        std::string label = j.at("timeframe").get<std::string>();
        if (!timeframe_from_string(label, timeframe)) {
            throw BacksimError(ErrorCode::INVALID_CONFIG, "Unknown timeframe: " + label,
                               "BacktestConfig");
        }
    }
    if (j.contains("start_time"))
        start_time = core::from_epoch_seconds(j.at("start_time").get<int64_t>());
    if (j.contains("end_time"))
        end_time = core::from_epoch_seconds(j.at("end_time").get<int64_t>());
    if (j.contains("initial_balance"))
        initial_balance = j.at("initial_balance").get<double>();
    if (j.contains("strategy_id"))
        strategy_id = j.at("strategy_id").get<std::string>();
    if (j.contains("strategy_params")) {
        strategy_params.clear();
        for (const auto& [name, value] : j.at("strategy_params").items()) {
            strategy_params[name] = value.get<double>();
        }
    }
    if (j.contains("position_size_percent"))
        position_size_percent = j.at("position_size_percent").get<double>();
    if (j.contains("stop_loss_percent"))
        stop_loss_percent = j.at("stop_loss_percent").get<double>();
    if (j.contains("take_profit_percent"))
        take_profit_percent = j.at("take_profit_percent").get<double>();
    if (j.contains("commission_percent"))
        commission_percent = j.at("commission_percent").get<double>();
    if (j.contains("slippage_percent"))
        slippage_percent = j.at("slippage_percent").get<double>();
    if (j.contains("progress_interval"))
        progress_interval = j.at("progress_interval").get<int64_t>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> BacktestConfig::validate() const {
    if (symbol.empty()) {
        return config_error("symbol must not be empty");
    }
    if (strategy_id.empty()) {
        return config_error("strategy_id must not be empty");
    }
    if (start_time > end_time) {
        return config_error("start_time " + core::format_utc(start_time) + " is after end_time " +
                            core::format_utc(end_time));
    }
    if (!std::isfinite(initial_balance) || initial_balance <= 0.0) {
        return config_error("initial_balance must be positive");
    }
    if (!std::isfinite(position_size_percent) || position_size_percent <= 0.0 ||
        position_size_percent > 100.0) {
        return config_error("position_size_percent must be in (0, 100]");
    }
    if (!in_open_range(stop_loss_percent, 0.0, 100.0)) {
        return config_error("stop_loss_percent must be in (0, 100)");
    }
    if (!in_open_range(take_profit_percent, 0.0, 100.0)) {
        return config_error("take_profit_percent must be in (0, 100)");
    }
    if (!std::isfinite(commission_percent) || commission_percent < 0.0 ||
        commission_percent >= 100.0) {
        return config_error("commission_percent must be in [0, 100)");
    }
    if (!std::isfinite(slippage_percent) || slippage_percent < 0.0 || slippage_percent >= 100.0) {
        return config_error("slippage_percent must be in [0, 100)");
    }
    if (progress_interval < 0) {
        return config_error("progress_interval must not be negative");
    }
    for (const auto& [name, value] : strategy_params) {
        if (!std::isfinite(value)) {
            return config_error("strategy parameter " + name + " must be finite");
        }
    }
    return Result<void>();
}

}  // namespace backtest
}  // namespace backsim
