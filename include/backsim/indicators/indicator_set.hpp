// include/backsim/indicators/indicator_set.hpp
#pragma once

#include <memory>
#include <vector>
#include "backsim/core/error.hpp"
#include "backsim/indicators/indicator_interface.hpp"
#include "backsim/indicators/types.hpp"

namespace backsim {

/**
 * @brief Build a calculator for a spec
 * @return INVALID_CONFIG for empty names or non-positive periods
 */
Result<std::unique_ptr<IndicatorCalculator>> make_indicator(const IndicatorSpec& spec);

/**
 * @brief The indicators of one run, updated together once per candle
 *
 * Owned by a single run; never shared between runs.
 */
class IndicatorSet {
public:
    IndicatorSet() = default;
    IndicatorSet(IndicatorSet&&) = default;
    IndicatorSet& operator=(IndicatorSet&&) = default;

    /**
     * @brief Create calculators for every spec
     * @return INVALID_CONFIG for an invalid spec or a duplicate name
     */
    static Result<IndicatorSet> create(const std::vector<IndicatorSpec>& specs);

    /**
     * @brief Feed the candle to every calculator
     * @return Fresh snapshots keyed by indicator name
     */
    const IndicatorValues& update(const Candle& candle);

    void reset();

    const IndicatorValues& values() const {
        return values_;
    }

    size_t size() const {
        return calculators_.size();
    }

private:
    std::vector<std::unique_ptr<IndicatorCalculator>> calculators_;
    IndicatorValues values_;
};

}  // namespace backsim
