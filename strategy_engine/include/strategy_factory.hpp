#pragma once

#include <string>
#include <vector>
#include <memory> // For std::unique_ptr
#include <nlohmann/json.hpp>

#include "interfaces.hpp"

namespace strategy_engine {

    using json = nlohmann::json;

    class StrategyFactory {
    public:
        // Builds a strategy from {"type": ..., "name": ..., "parameters": {...}}.
        // Throws core::StrategyException on unknown types or bad parameters.
        static std::unique_ptr<IStrategy> createStrategy(const json& config);

        // Type names accepted by createStrategy
        static std::vector<std::string> availableTypes();
    };

} // namespace strategy_engine
