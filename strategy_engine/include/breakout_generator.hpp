#pragma once

#include "signal_generator.hpp"
#include "indicators.hpp"

namespace strategy_engine {

    struct BreakoutParams {
        int channel_lookback = 20;      // Prior bars forming the breakout level
        int atr_period = 14;
        double atr_stop_multiplier = 1.5;
        double reward_risk = 2.0;
        double volume_multiplier = 1.0; // Breakout bar volume vs. channel average, 0 disables
        bool require_retest = true;
    };

    // Trend-regime generator. A close beyond the prior channel extreme produces
    // a signal at the channel level; by default it waits for a retest of that level.
    class BreakoutGenerator : public ISignalGenerator {
    public:
        BreakoutGenerator(BreakoutParams params, const indicators::IIndicatorLibrary& indicators);

        std::string getName() const override { return "trend_breakout"; }
        GeneratorKind kind() const override { return GeneratorKind::Breakout; }
        std::size_t requiredHistory() const override;
        std::optional<core::Signal> generateSignal(const MarketContext& context) const override;

        const BreakoutParams& params() const { return params_; }

    private:
        BreakoutParams params_;
        const indicators::IIndicatorLibrary& indicators_;
    };

} // namespace strategy_engine
