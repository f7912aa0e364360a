#pragma once

#include <optional>
#include <string>

#include "datatypes.hpp" // Provides Candle, Signal, TimeSeries

namespace strategy_engine {

    // The fixed set of generators the router can pick from
    enum class GeneratorKind {
        MeanReversion, // Range-bound regime
        Breakout       // Trending regime
    };

    const char* generatorKindToString(GeneratorKind kind);

    // Everything a generator may look at for one instrument in one cycle
    struct MarketContext {
        std::string instrument_key;
        const core::TimeSeries<core::Candle>* bars = nullptr; // Ordered, last element is the most recent bar
        core::Timestamp now;
        double regime_value = 0.0; // Regime indicator at the last bar (ADX by default)
    };

    class ISignalGenerator {
    public:
        virtual ~ISignalGenerator() = default;

        virtual std::string getName() const = 0;
        virtual GeneratorKind kind() const = 0;

        // Bars needed before generateSignal can say anything
        virtual std::size_t requiredHistory() const = 0;

        // Zero or one signal. Throws core::DataException when indicators are unusable.
        virtual std::optional<core::Signal> generateSignal(const MarketContext& context) const = 0;
    };

} // namespace strategy_engine
