#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <string>
#include <vector>

namespace strategy_engine {

    // Trades only while ADX reports a strong trend, using price vs. SMA for
    // direction. Held positions are closed once the trend weakens.
    class TrendFollowingStrategy : public IStrategy {
    public:
        explicit TrendFollowingStrategy(TrendFollowingParams params, std::string name = "TrendFollowing");

        std::string getName() const override { return name_; }
        const TrendFollowingParams& getParams() const { return params_; }

        std::vector<core::OrderRequest> generateSignals(
            const core::MarketData& data,
            core::Timestamp timestamp,
            const core::PositionMap& positions,
            double cash) const override;

    private:
        TrendFollowingParams params_;
        std::string name_;
    };

} // namespace strategy_engine
