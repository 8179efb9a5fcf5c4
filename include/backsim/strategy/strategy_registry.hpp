// include/backsim/strategy/strategy_registry.hpp
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "backsim/core/error.hpp"
#include "backsim/strategy/strategy_interface.hpp"

namespace backsim {

/**
 * @brief Builds a strategy from raw parameters, validating them
 */
using StrategyFactory =
    std::function<Result<std::unique_ptr<StrategyInterface>>(const StrategyParams&)>;

/**
 * @brief Maps strategy ids to factories
 *
 * The process-wide instance comes pre-populated with the built-in variants.
 * Lookups and registrations are serialized; the strategies it creates are
 * independent of it.
 */
class StrategyRegistry {
public:
    /**
     * @brief Get singleton instance of the registry
     */
    static StrategyRegistry& instance() {
        static StrategyRegistry instance(true);
        return instance;
    }

    /**
     * @brief Create an empty registry, optionally with the built-in strategies
     */
    explicit StrategyRegistry(bool with_builtins = false);

    /**
     * @brief Add or replace a factory
     * @return INVALID_ARGUMENT for an empty id or missing factory
     */
    Result<void> register_strategy(const std::string& id, StrategyFactory factory);

    /**
     * @brief Instantiate a strategy by id
     * @return UNKNOWN_STRATEGY for an unregistered id, or the factory's
     *         INVALID_CONFIG for bad parameters
     */
    Result<std::unique_ptr<StrategyInterface>> create(const std::string& id,
                                                      const StrategyParams& params) const;

    bool has_strategy(const std::string& id) const;

    /**
     * @brief Registered ids in sorted order
     */
    std::vector<std::string> strategy_ids() const;

private:
    StrategyRegistry(const StrategyRegistry&) = delete;
    StrategyRegistry& operator=(const StrategyRegistry&) = delete;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, StrategyFactory> factories_;
};

}  // namespace backsim
