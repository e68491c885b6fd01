#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <string>
#include <vector>

namespace strategy_engine {

    // Bollinger band touch: buy at the lower band, exit at the upper band or
    // on the stop loss.
    class MeanReversionStrategy : public IStrategy {
    public:
        explicit MeanReversionStrategy(MeanReversionParams params,
                                       std::string name = "MeanReversion");

        std::string getName() const override { return name_; }
        const MeanReversionParams& getParams() const { return params_; }

        std::vector<core::OrderRequest> generateSignals(
            const core::MarketData& data,
            core::Timestamp timestamp,
            const core::PositionMap& positions,
            double cash) const override;

    private:
        MeanReversionParams params_;
        std::string name_;
    };

} // namespace strategy_engine
