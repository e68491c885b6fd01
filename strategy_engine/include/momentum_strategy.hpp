#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <string>
#include <vector>

namespace strategy_engine {

    // RSI threshold crossings: enter when RSI climbs out of oversold, exit
    // when it falls back from overbought.
    class MomentumStrategy : public IStrategy {
    public:
        explicit MomentumStrategy(MomentumParams params, std::string name = "Momentum");

        std::string getName() const override { return name_; }
        const MomentumParams& getParams() const { return params_; }

        std::vector<core::OrderRequest> generateSignals(
            const core::MarketData& data,
            core::Timestamp timestamp,
            const core::PositionMap& positions,
            double cash) const override;

    private:
        MomentumParams params_;
        std::string name_;
    };

} // namespace strategy_engine
