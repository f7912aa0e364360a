#pragma once

#include "indicators.hpp"
#include <memory>
#include <string>
#include <vector>

namespace indicators {

struct IndicatorSpec {
    std::string kind;           // e.g. "ADX"
    std::vector<double> params; // e.g. {14}
};

// "BB_UPPER(20,2)" -> {"BB_UPPER", {20, 2}}. Throws core::IndicatorCalculationException on bad syntax.
IndicatorSpec parseIndicatorName(const std::string& name);

// Builds a concrete indicator for a parsed spec. Throws core::IndicatorCalculationException for unknown kinds.
std::unique_ptr<IIndicator> createIndicator(const IndicatorSpec& spec);

class TaLibIndicatorLibrary : public IIndicatorLibrary {
public:
    TaLibIndicatorLibrary();

    core::TimeSeries<double> compute(const core::TimeSeries<core::Candle>& bars,
                                     const std::string& name) const override;
};

} // namespace indicators
