#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <string>
#include <vector>

namespace strategy_engine {

    // Buys when the fast SMA crosses above the slow SMA while flat and sells
    // the whole position when it crosses back below.
    class MovingAverageCrossoverStrategy : public IStrategy {
    public:
        explicit MovingAverageCrossoverStrategy(MovingAverageCrossoverParams params,
                                                std::string name = "MovingAverageCrossover");

        std::string getName() const override { return name_; }
        const MovingAverageCrossoverParams& getParams() const { return params_; }

        std::vector<core::OrderRequest> generateSignals(
            const core::MarketData& data,
            core::Timestamp timestamp,
            const core::PositionMap& positions,
            double cash) const override;

    private:
        MovingAverageCrossoverParams params_;
        std::string name_;
    };

} // namespace strategy_engine
