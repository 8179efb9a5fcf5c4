// include/backsim/backtest/result_serialization.hpp
#pragma once

#include <nlohmann/json.hpp>
#include "backsim/backtest/types.hpp"

namespace backsim {
namespace backtest {

nlohmann::json to_json(const Trade& trade);
nlohmann::json to_json(const Position& position);
nlohmann::json to_json(const EquityPoint& point);

/**
 * @brief Serialize a result; timestamps become epoch seconds
 * @param include_equity_curve Omit the per-candle curve for compact summaries
 */
nlohmann::json to_json(const BacktestResult& result, bool include_equity_curve = true);

}  // namespace backtest
}  // namespace backsim
