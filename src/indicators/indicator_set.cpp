// src/indicators/indicator_set.cpp
#include "backsim/indicators/indicator_set.hpp"
#include <unordered_set>
#include "backsim/indicators/donchian.hpp"
#include "backsim/indicators/macd.hpp"
#include "backsim/indicators/moving_average.hpp"
#include "backsim/indicators/rsi.hpp"

namespace backsim {

namespace {

Result<void> validate_spec(const IndicatorSpec& spec) {
    if (spec.name.empty()) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "Indicator name must not be empty",
                                "IndicatorSet");
    }

    if (spec.type == IndicatorType::MACD_HISTOGRAM) {
        if (spec.fast_period < 1 || spec.slow_period < 1 || spec.signal_period < 1) {
            return make_error<void>(ErrorCode::INVALID_CONFIG,
                                    "MACD periods must be positive for " + spec.name,
                                    "IndicatorSet");
        }
        if (spec.fast_period >= spec.slow_period) {
            return make_error<void>(ErrorCode::INVALID_CONFIG,
                                    "MACD fast period must be shorter than slow period for " +
                                        spec.name,
                                    "IndicatorSet");
        }
        return Result<void>();
    }

    if (spec.period < 1) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "Period must be positive for " + spec.name, "IndicatorSet");
    }
    return Result<void>();
}

}  // namespace

Result<std::unique_ptr<IndicatorCalculator>> make_indicator(const IndicatorSpec& spec) {
    auto valid = validate_spec(spec);
    if (valid.is_error()) {
        return make_error<std::unique_ptr<IndicatorCalculator>>(
            valid.error()->code(), valid.error()->what(), "IndicatorSet");
    }

    std::unique_ptr<IndicatorCalculator> calculator;
    switch (spec.type) {
        case IndicatorType::SMA:
            calculator = std::make_unique<SmaCalculator>(spec);
            break;
        case IndicatorType::EMA:
            calculator = std::make_unique<EmaCalculator>(spec);
            break;
        case IndicatorType::RSI:
            calculator = std::make_unique<RsiCalculator>(spec);
            break;
        case IndicatorType::MACD_HISTOGRAM:
            calculator = std::make_unique<MacdCalculator>(spec);
            break;
        case IndicatorType::DONCHIAN_UPPER:
        case IndicatorType::DONCHIAN_LOWER:
            calculator = std::make_unique<DonchianCalculator>(spec);
            break;
    }

    if (!calculator) {
        return make_error<std::unique_ptr<IndicatorCalculator>>(
            ErrorCode::INVALID_CONFIG, "Unsupported indicator type for " + spec.name,
            "IndicatorSet");
    }
    return Result<std::unique_ptr<IndicatorCalculator>>(std::move(calculator));
}

Result<IndicatorSet> IndicatorSet::create(const std::vector<IndicatorSpec>& specs) {
    IndicatorSet set;
    std::unordered_set<std::string> names;

    for (const auto& spec : specs) {
        if (!names.insert(spec.name).second) {
            return make_error<IndicatorSet>(ErrorCode::INVALID_CONFIG,
                                            "Duplicate indicator name: " + spec.name,
                                            "IndicatorSet");
        }

        auto calculator = make_indicator(spec);
        if (calculator.is_error()) {
            return make_error<IndicatorSet>(calculator.error()->code(),
                                            calculator.error()->what(), "IndicatorSet");
        }
        set.calculators_.push_back(calculator.take_value());
        set.values_[spec.name] = IndicatorSnapshot{};
    }

    return Result<IndicatorSet>(std::move(set));
}

const IndicatorValues& IndicatorSet::update(const Candle& candle) {
    for (auto& calculator : calculators_) {
        values_[calculator->spec().name] = calculator->update(candle);
    }
    return values_;
}

void IndicatorSet::reset() {
    for (auto& calculator : calculators_) {
        calculator->reset();
        values_[calculator->spec().name] = IndicatorSnapshot{};
    }
}

}  // namespace backsim
