#pragma once

#include "interfaces.hpp"
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace strategy_engine {

    // Adapts any callable with the generateSignals signature to IStrategy
    class LambdaStrategy : public IStrategy {
    public:
        using SignalFunction = std::function<std::vector<core::OrderRequest>(
            const core::MarketData&, core::Timestamp, const core::PositionMap&, double)>;

        LambdaStrategy(std::string name, SignalFunction fn)
            : name_(std::move(name)), fn_(std::move(fn))
        {
            if (!fn_) {
                throw std::invalid_argument("LambdaStrategy requires a callable.");
            }
        }

        std::string getName() const override { return name_; }

        std::vector<core::OrderRequest> generateSignals(
            const core::MarketData& data,
            core::Timestamp timestamp,
            const core::PositionMap& positions,
            double cash) const override
        {
            return fn_(data, timestamp, positions, cash);
        }

    private:
        std::string name_;
        SignalFunction fn_;
    };

} // namespace strategy_engine
