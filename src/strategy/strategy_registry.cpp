// src/strategy/strategy_registry.cpp
#include "backsim/strategy/strategy_registry.hpp"
#include <algorithm>
#include "backsim/core/logger.hpp"
#include "backsim/strategy/breakout.hpp"
#include "backsim/strategy/ema_crossover.hpp"
#include "backsim/strategy/macd_trend.hpp"
#include "backsim/strategy/rsi_mean_reversion.hpp"

namespace backsim {

StrategyRegistry::StrategyRegistry(bool with_builtins) {
    if (with_builtins) {
        factories_[EmaCrossoverStrategy::ID] = &EmaCrossoverStrategy::create;
        factories_[RsiMeanReversionStrategy::ID] = &RsiMeanReversionStrategy::create;
        factories_[MacdTrendStrategy::ID] = &MacdTrendStrategy::create;
        factories_[BreakoutStrategy::ID] = &BreakoutStrategy::create;
    }
}

Result<void> StrategyRegistry::register_strategy(const std::string& id, StrategyFactory factory) {
    if (id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Strategy id must not be empty",
                                "StrategyRegistry");
    }
    if (!factory) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Factory for strategy " + id + " is empty", "StrategyRegistry");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (factories_.count(id) > 0) {
        WARN("Replacing factory for strategy " << id);
    }
    factories_[id] = std::move(factory);
    return Result<void>();
}

Result<std::unique_ptr<StrategyInterface>> StrategyRegistry::create(
    const std::string& id, const StrategyParams& params) const {
    StrategyFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(id);
        if (it == factories_.end()) {
            return make_error<std::unique_ptr<StrategyInterface>>(
                ErrorCode::UNKNOWN_STRATEGY, "Unknown strategy id: " + id, "StrategyRegistry");
        }
        factory = it->second;
    }

    auto strategy = factory(params);
    if (strategy.is_ok() && !strategy.value()) {
        return make_error<std::unique_ptr<StrategyInterface>>(
            ErrorCode::STRATEGY_ERROR, "Factory for " + id + " returned no strategy",
            "StrategyRegistry");
    }
    return strategy;
}

bool StrategyRegistry::has_strategy(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(id) > 0;
}

std::vector<std::string> StrategyRegistry::strategy_ids() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(factories_.size());
        for (const auto& entry : factories_) {
            ids.push_back(entry.first);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace backsim
