#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace strategy_engine {

    // Mean reversion on the close-price spread of two symbols, measured as a
    // rolling z-score. Long-only: the "short" leg is expressed by selling an
    // existing holding.
    class PairsTradingStrategy : public IStrategy {
    public:
        explicit PairsTradingStrategy(PairsTradingParams params, std::string name = "PairsTrading");

        std::string getName() const override { return name_; }
        const PairsTradingParams& getParams() const { return params_; }

        std::vector<core::OrderRequest> generateSignals(
            const core::MarketData& data,
            core::Timestamp timestamp,
            const core::PositionMap& positions,
            double cash) const override;

        // z-score of the latest spread over the lookback window; nullopt when
        // there is not enough aligned history or the spread has no variance
        std::optional<double> spreadZScore(const core::MarketData& data, core::Timestamp timestamp) const;

    private:
        PairsTradingParams params_;
        std::string name_;
    };

} // namespace strategy_engine
