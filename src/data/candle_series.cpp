#include "backsim/data/candle_series.hpp"
#include <algorithm>
#include <cmath>
#include "backsim/core/time_utils.hpp"

namespace backsim {

CandleSeries::CandleSeries(std::string symbol, Timeframe timeframe, std::vector<Candle> candles)
    : symbol_(std::move(symbol)), timeframe_(timeframe), candles_(std::move(candles)) {}

Result<void> CandleSeries::validate() const {
    for (size_t i = 0; i < candles_.size(); ++i) {
        const Candle& c = candles_[i];
        const std::string where = "candle " + std::to_string(i) + " (" +
                                  core::format_utc(c.timestamp) + ")";

        if (!std::isfinite(c.open) || !std::isfinite(c.high) || !std::isfinite(c.low) ||
            !std::isfinite(c.close) || !std::isfinite(c.volume)) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Non-finite value in " + where, "CandleSeries");
        }
        if (c.high < std::max(c.open, c.close)) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "High below open/close in " + where, "CandleSeries");
        }
        if (c.low > std::min(c.open, c.close)) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Low above open/close in " + where, "CandleSeries");
        }
        if (c.volume < 0.0) {
            return make_error<void>(ErrorCode::INVALID_DATA, "Negative volume in " + where,
                                    "CandleSeries");
        }
        if (i > 0 && c.timestamp <= candles_[i - 1].timestamp) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Timestamps not strictly increasing at " + where,
                                    "CandleSeries");
        }
    }
    return Result<void>();
}

CandleSeries CandleSeries::slice(const Timestamp& start, const Timestamp& end) const {
    std::vector<Candle> window;
    window.reserve(candles_.size());
    for (const auto& candle : candles_) {
        if (candle.timestamp >= start && candle.timestamp <= end) {
            window.push_back(candle);
        }
    }
    return CandleSeries(symbol_, timeframe_, std::move(window));
}

}  // namespace backsim
