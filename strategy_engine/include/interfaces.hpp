#pragma once

#include <vector>
#include <string>

#include "datatypes.hpp"   // Provides OrderRequest, PositionMap, Timestamp
#include "market_data.hpp" // Provides MarketData

namespace strategy_engine {

    // --- Strategy Interface ---
    // A strategy turns the market history visible at `timestamp` plus the
    // engine's open positions and cash into zero or more order requests.
    // Implementations must only read bars at or before `timestamp`
    // (MarketData::history) and must not keep state between calls that
    // changes what they return.
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        // Get the unique name/ID of the strategy
        virtual std::string getName() const = 0;

        virtual std::vector<core::OrderRequest> generateSignals(
            const core::MarketData& data,
            core::Timestamp timestamp,
            const core::PositionMap& positions,
            double cash) const = 0;
    };

} // namespace strategy_engine
