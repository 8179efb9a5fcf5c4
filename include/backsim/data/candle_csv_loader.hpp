// include/backsim/data/candle_csv_loader.hpp
#pragma once

#include <istream>
#include <string>
#include "backsim/core/error.hpp"
#include "backsim/core/types.hpp"
#include "backsim/data/candle_series.hpp"

namespace backsim {

/**
 * @brief Reads OHLCV candles from CSV
 *
 * Expected columns: timestamp,open,high,low,close,volume. A leading header
 * row is skipped, as are blank lines and lines starting with '#'. Timestamps
 * may be epoch seconds, epoch milliseconds (13+ digits) or UTC
 * "YYYY-MM-DD" / "YYYY-MM-DD HH:MM:SS" / "YYYY-MM-DDTHH:MM:SS".
 *
 * The loader only parses; ordering and OHLC invariants are checked by
 * CandleSeries::validate when the run starts.
 */
class CandleCsvLoader {
public:
    CandleCsvLoader(std::string symbol, Timeframe timeframe);

    Result<CandleSeries> load_file(const std::string& path) const;

    Result<CandleSeries> load_stream(std::istream& input) const;

    /**
     * @brief Parse one timestamp field
     */
    static Result<Timestamp> parse_timestamp(const std::string& field);

private:
    std::string symbol_;
    Timeframe timeframe_;
};

}  // namespace backsim
