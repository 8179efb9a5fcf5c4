// include/backsim/data/candle_series.hpp
#pragma once

#include <string>
#include <vector>
#include "backsim/core/error.hpp"
#include "backsim/core/types.hpp"

namespace backsim {

/**
 * @brief Ordered OHLCV bars for one symbol and timeframe
 *
 * The series owns its candles for the duration of a run. It never mutates
 * them; `slice` returns a new series.
 */
class CandleSeries {
public:
    CandleSeries() = default;
    CandleSeries(std::string symbol, Timeframe timeframe, std::vector<Candle> candles);

    /**
     * @brief Check bar invariants and strict timestamp ordering
     *
     * Rejects non-finite prices, high below max(open, close), low above
     * min(open, close), negative volume and non-increasing timestamps. An
     * empty series is valid.
     *
     * @return Result with INVALID_DATA naming the first offending index
     */
    Result<void> validate() const;

    /**
     * @brief Candles with start <= timestamp <= end
     */
    CandleSeries slice(const Timestamp& start, const Timestamp& end) const;

    const std::string& symbol() const {
        return symbol_;
    }
    Timeframe timeframe() const {
        return timeframe_;
    }
    const std::vector<Candle>& candles() const {
        return candles_;
    }
    size_t size() const {
        return candles_.size();
    }
    bool empty() const {
        return candles_.empty();
    }
    const Candle& operator[](size_t index) const {
        return candles_[index];
    }

private:
    std::string symbol_;
    Timeframe timeframe_{Timeframe::DAILY};
    std::vector<Candle> candles_;
};

}  // namespace backsim
