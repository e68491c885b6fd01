#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Average Directional Index (trend strength, 0-100) from high/low/close.
// TR, +DM/-DM and DX are averaged with simple rolling means. NaN where a
// window holds a bar with no range or no directional movement.
class AdxIndicator : public IIndicator {
public:
    explicit AdxIndicator(int period);

    ~AdxIndicator() override = default;

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
