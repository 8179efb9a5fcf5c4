// include/backsim/indicators/indicator_interface.hpp
#pragma once

#include <optional>
#include "backsim/core/types.hpp"
#include "backsim/indicators/types.hpp"

namespace backsim {

/**
 * @brief Base class for incremental indicator calculators
 *
 * Each calculator consumes one candle at a time, in timestamp order, and owns
 * its rolling state exclusively. Subclasses implement `compute` (return
 * std::nullopt while warming up) and `clear_state`; the base class carries the
 * previous snapshot so strategies can detect crossovers without state of
 * their own.
 */
class IndicatorCalculator {
public:
    explicit IndicatorCalculator(IndicatorSpec spec) : spec_(std::move(spec)) {}
    virtual ~IndicatorCalculator() = default;

    IndicatorCalculator(const IndicatorCalculator&) = delete;
    IndicatorCalculator& operator=(const IndicatorCalculator&) = delete;

    /**
     * @brief Feed the next candle
     * @return Snapshot including the previous candle's value
     */
    IndicatorSnapshot update(const Candle& candle) {
        std::optional<double> current = compute(candle);

        IndicatorSnapshot snapshot;
        snapshot.previous_ready = last_.ready;
        snapshot.previous_value = last_.value;
        snapshot.ready = current.has_value();
        snapshot.value = current.value_or(0.0);

        last_ = snapshot;
        return snapshot;
    }

    /**
     * @brief Discard all history; the next update behaves like the first
     */
    void reset() {
        clear_state();
        last_ = IndicatorSnapshot{};
    }

    const IndicatorSnapshot& last() const {
        return last_;
    }

    const IndicatorSpec& spec() const {
        return spec_;
    }

protected:
    virtual std::optional<double> compute(const Candle& candle) = 0;
    virtual void clear_state() = 0;

    IndicatorSpec spec_;

private:
    IndicatorSnapshot last_;
};

}  // namespace backsim
