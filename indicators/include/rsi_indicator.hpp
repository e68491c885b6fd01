#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// RSI on close prices from simple rolling means of gains and losses,
// values in [0, 100]. NaN where the window holds no price change.
class RsiIndicator : public IIndicator {
public:
    explicit RsiIndicator(int period);

    ~RsiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
