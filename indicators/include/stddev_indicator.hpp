#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Rolling sample (n - 1) standard deviation of close prices
class StdDevIndicator : public IIndicator {
public:
    explicit StdDevIndicator(int period);

    ~StdDevIndicator() override = default;

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
