#pragma once

#include "datatypes.hpp" // Needs Candle, TimeSeries
#include <string>
#include <vector>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Canonical name including parameters (e.g., "SMA(20)")
    virtual std::string getName() const = 0;

    // Number of leading bars that cannot produce a value
    virtual int getLookback() const = 0;

    // Calculate the indicator based on input candle data and store the result internally
    virtual void calculate(const core::TimeSeries<core::Candle>& input) = 0;

    // Result aligned to the input: same length, NaN for the first getLookback() bars
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

// Facade the strategy and screening layers talk to. Implementations are pure:
// the same bars and name always give the same series.
class IIndicatorLibrary {
public:
    virtual ~IIndicatorLibrary() = default;

    // name is "<KIND>(<p1>[,<p2>])", e.g. "ADX(14)" or "BB_UPPER(20,2)".
    // Throws core::IndicatorCalculationException for unknown names or calculation failures.
    virtual core::TimeSeries<double> compute(const core::TimeSeries<core::Candle>& bars,
                                             const std::string& name) const = 0;
};

// Value at the most recent bar, NaN for an empty series
double lastValue(const core::TimeSeries<double>& series);

} // namespace indicators
