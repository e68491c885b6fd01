#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "market_data.hpp"

namespace data {

    struct SyntheticDataParams {
        double start_price = 100.0;
        double daily_drift = 0.0003;       // Mean log return per bar
        double daily_volatility = 0.015;   // Std dev of log return per bar
        double intrabar_range = 0.01;      // High/low spread around open/close, as a fraction
        long long base_volume = 1000000;
        std::uint32_t seed = 42;
    };

    // Deterministic daily bars for demos and tests: a geometric random walk
    // of closes, one independent walk per symbol.
    class SyntheticDataGenerator {
    public:
        explicit SyntheticDataGenerator(SyntheticDataParams params = SyntheticDataParams{});

        // One bar per calendar day in [start, end], both at midnight UTC.
        // Throws std::invalid_argument if end < start.
        core::TimeSeries<core::Candle> generateSeries(core::Timestamp start,
                                                      core::Timestamp end,
                                                      std::uint32_t seed_offset = 0) const;

        core::MarketData generate(const std::vector<std::string>& symbols,
                                  core::Timestamp start,
                                  core::Timestamp end) const;

        const SyntheticDataParams& getParams() const { return params_; }

    private:
        SyntheticDataParams params_;
    };

} // namespace data
