// src/data/candle_csv_loader.cpp
#include "backsim/data/candle_csv_loader.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>
#include "backsim/core/logger.hpp"
#include "backsim/core/time_utils.hpp"

namespace backsim {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-') ? 1 : 0;
    if (start == s.size()) return false;
    return std::all_of(s.begin() + start, s.end(),
                       [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

}  // namespace

CandleCsvLoader::CandleCsvLoader(std::string symbol, Timeframe timeframe)
    : symbol_(std::move(symbol)), timeframe_(timeframe) {}

Result<Timestamp> CandleCsvLoader::parse_timestamp(const std::string& field) {
    std::string value = trim(field);
    if (value.empty()) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR, "Empty timestamp",
                                     "CandleCsvLoader");
    }

    if (is_integer(value)) {
        try {
            long long raw = std::stoll(value);
            // 13 digits and up is milliseconds since the epoch
            if (value.size() >= 13) {
                return Result<Timestamp>(Timestamp(std::chrono::milliseconds(raw)));
            }
            return Result<Timestamp>(core::from_epoch_seconds(raw));
        } catch (const std::out_of_range&) {
            return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                         "Timestamp out of range: " + value, "CandleCsvLoader");
        }
    }

    std::string normalized = value;
    std::replace(normalized.begin(), normalized.end(), 'T', ' ');
    if (!normalized.empty() && normalized.back() == 'Z') {
        normalized.pop_back();
    }

    std::tm tm = {};
    std::istringstream in(normalized);
    if (normalized.size() > 10) {
        in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    } else {
        in >> std::get_time(&tm, "%Y-%m-%d");
    }
    if (in.fail()) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Unrecognized timestamp format: " + value, "CandleCsvLoader");
    }

    std::time_t epoch = core::safe_timegm(&tm);
    return Result<Timestamp>(core::from_epoch_seconds(static_cast<int64_t>(epoch)));
}

Result<CandleSeries> CandleCsvLoader::load_file(const std::string& path) const {
    if (!std::filesystem::exists(path)) {
        return make_error<CandleSeries>(ErrorCode::FILE_NOT_FOUND,
                                        "Candle file not found: " + path, "CandleCsvLoader");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<CandleSeries>(ErrorCode::FILE_IO_ERROR,
                                        "Failed to open candle file: " + path, "CandleCsvLoader");
    }

    INFO("Loading candles for " << symbol_ << " from " << path);
    return load_stream(file);
}

Result<CandleSeries> CandleCsvLoader::load_stream(std::istream& input) const {
    std::vector<Candle> candles;
    std::string line;
    size_t line_number = 0;
    bool seen_data = false;

    while (std::getline(input, line)) {
        ++line_number;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }

        auto fields = split_fields(content);
        // First row whose timestamp does not parse is a header
        if (!seen_data && !fields.empty() && parse_timestamp(fields[0]).is_error()) {
            seen_data = true;
            continue;
        }
        seen_data = true;

        if (fields.size() < 6) {
            return make_error<CandleSeries>(
                ErrorCode::CONVERSION_ERROR,
                "Line " + std::to_string(line_number) + ": expected 6 fields, got " +
                    std::to_string(fields.size()),
                "CandleCsvLoader");
        }

        auto ts_result = parse_timestamp(fields[0]);
        if (ts_result.is_error()) {
            return make_error<CandleSeries>(
                ErrorCode::CONVERSION_ERROR,
                "Line " + std::to_string(line_number) + ": " + ts_result.error()->what(),
                "CandleCsvLoader");
        }

        Candle candle;
        candle.timestamp = ts_result.value();
        try {
            candle.open = std::stod(fields[1]);
            candle.high = std::stod(fields[2]);
            candle.low = std::stod(fields[3]);
            candle.close = std::stod(fields[4]);
            candle.volume = std::stod(fields[5]);
        } catch (const std::exception& e) {
            return make_error<CandleSeries>(
                ErrorCode::CONVERSION_ERROR,
                "Line " + std::to_string(line_number) + ": malformed number (" + e.what() + ")",
                "CandleCsvLoader");
        }

        candles.push_back(candle);
    }

    if (input.bad()) {
        return make_error<CandleSeries>(ErrorCode::FILE_IO_ERROR, "Read error on candle input",
                                        "CandleCsvLoader");
    }

    DEBUG("Parsed " << candles.size() << " candles for " << symbol_);
    return Result<CandleSeries>(CandleSeries(symbol_, timeframe_, std::move(candles)));
}

}  // namespace backsim
