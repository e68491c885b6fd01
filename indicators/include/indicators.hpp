#pragma once

#include "datatypes.hpp" // Needs Candle, TimeSeries
#include <string>
#include <vector>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "SMA(20)", "RSI(14)")
    virtual std::string getName() const = 0;

    // Get the lookback period required by the indicator calculation
    // This determines how many initial input data points are consumed
    // before the first valid output can be generated.
    virtual int getLookback() const = 0;

    // Calculate the indicator based on input candle data
    // It should store the result internally.
    virtual void calculate(const core::TimeSeries<core::Candle>& input) = 0;

    // Get the calculated results.
    // Result element k corresponds to input element k + getLookback().
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

// Extracts the close column of a candle series for TA-Lib input arrays
inline std::vector<double> closePrices(const core::TimeSeries<core::Candle>& input) {
    std::vector<double> close_prices;
    close_prices.reserve(input.size());
    for (const auto& candle : input) {
        close_prices.push_back(candle.close);
    }
    return close_prices;
}

} // namespace indicators
