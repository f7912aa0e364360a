#pragma once

#include "signal_generator.hpp"
#include "indicators.hpp"

namespace strategy_engine {

    struct MeanReversionParams {
        int bb_period = 20;
        double bb_deviations = 2.0;
        int rsi_period = 14;
        double rsi_oversold = 30.0;
        double rsi_overbought = 70.0;
        int atr_period = 14;
        double atr_stop_multiplier = 1.5;
        double reward_risk = 1.5;
    };

    // Fades band extremes: long at the lower Bollinger band with oversold RSI,
    // short at the upper band with overbought RSI. Stop is ATR based.
    class MeanReversionGenerator : public ISignalGenerator {
    public:
        MeanReversionGenerator(MeanReversionParams params, const indicators::IIndicatorLibrary& indicators);

        std::string getName() const override { return "mean_reversion"; }
        GeneratorKind kind() const override { return GeneratorKind::MeanReversion; }
        std::size_t requiredHistory() const override;
        std::optional<core::Signal> generateSignal(const MarketContext& context) const override;

        const MeanReversionParams& params() const { return params_; }

    private:
        MeanReversionParams params_;
        const indicators::IIndicatorLibrary& indicators_;
    };

} // namespace strategy_engine
