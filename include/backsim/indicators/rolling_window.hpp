// include/backsim/indicators/rolling_window.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <numeric>

namespace backsim {

/**
 * @brief Fixed-capacity FIFO window over the most recent values
 *
 * Pushing into a full window evicts the oldest value, so memory stays bounded
 * by the capacity regardless of series length. Index 0 is the oldest value.
 */
template <typename T>
class RollingWindow {
public:
    explicit RollingWindow(size_t capacity) : capacity_(capacity) {}

    void push(const T& value) {
        if (capacity_ == 0) {
            return;
        }
        if (values_.size() == capacity_) {
            values_.pop_front();
        }
        values_.push_back(value);
    }

    void clear() {
        values_.clear();
    }

    size_t size() const {
        return values_.size();
    }
    size_t capacity() const {
        return capacity_;
    }
    bool empty() const {
        return values_.empty();
    }
    bool full() const {
        return capacity_ > 0 && values_.size() == capacity_;
    }

    const T& operator[](size_t index) const {
        return values_[index];
    }
    const T& oldest() const {
        return values_.front();
    }
    const T& newest() const {
        return values_.back();
    }

    // Summation always runs oldest to newest so results are reproducible
    T sum() const {
        return std::accumulate(values_.begin(), values_.end(), T{});
    }

    T mean() const {
        if (values_.empty()) {
            return T{};
        }
        return sum() / static_cast<T>(values_.size());
    }

    T max() const {
        return *std::max_element(values_.begin(), values_.end());
    }

    T min() const {
        return *std::min_element(values_.begin(), values_.end());
    }

    typename std::deque<T>::const_iterator begin() const {
        return values_.begin();
    }
    typename std::deque<T>::const_iterator end() const {
        return values_.end();
    }

private:
    size_t capacity_;
    std::deque<T> values_;
};

}  // namespace backsim
