#include "synthetic_data_generator.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>
#include <stdexcept>

namespace data {

    SyntheticDataGenerator::SyntheticDataGenerator(SyntheticDataParams params)
        : params_(params)
    {
        if (params_.start_price <= 0.0) {
            throw std::invalid_argument("Synthetic start price must be positive.");
        }
        if (params_.daily_volatility < 0.0 || params_.intrabar_range < 0.0) {
            throw std::invalid_argument("Synthetic volatility and range must be non-negative.");
        }
    }

    core::TimeSeries<core::Candle> SyntheticDataGenerator::generateSeries(core::Timestamp start,
                                                                          core::Timestamp end,
                                                                          std::uint32_t seed_offset) const
    {
        if (end < start) {
            throw std::invalid_argument("Synthetic data end date precedes start date.");
        }

        std::mt19937 rng(params_.seed + seed_offset);
        std::normal_distribution<double> log_return(params_.daily_drift, params_.daily_volatility);
        std::uniform_real_distribution<double> unit(0.0, 1.0);

        const auto day = std::chrono::hours(24);
        core::TimeSeries<core::Candle> series;
        double previous_close = params_.start_price;

        for (core::Timestamp ts = start; ts <= end; ts += day) {
            core::Candle candle;
            candle.timestamp = ts;
            candle.open = previous_close;
            candle.close = previous_close * std::exp(log_return(rng));
            double top = std::max(candle.open, candle.close);
            double bottom = std::min(candle.open, candle.close);
            candle.high = top * (1.0 + params_.intrabar_range * unit(rng));
            candle.low = bottom * (1.0 - params_.intrabar_range * unit(rng));
            candle.volume = static_cast<long long>(params_.base_volume * (0.5 + unit(rng)));
            series.push_back(candle);
            previous_close = candle.close;
        }
        return series;
    }

    core::MarketData SyntheticDataGenerator::generate(const std::vector<std::string>& symbols,
                                                      core::Timestamp start,
                                                      core::Timestamp end) const
    {
        auto logger = core::logging::getLogger();
        core::MarketData market_data;
        std::uint32_t offset = 0;
        for (const auto& symbol : symbols) {
            market_data.addSeries(symbol, generateSeries(start, end, offset++));
        }
        logger->info("Generated synthetic data for {} symbols from {} to {} (seed {}).",
                     symbols.size(),
                     core::utils::timestampToString(start),
                     core::utils::timestampToString(end),
                     params_.seed);
        return market_data;
    }

} // namespace data
