#pragma once

#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"

namespace screening {

    // Market view handed to every level for one candidate signal
    struct MarketState {
        core::Timestamp now;
        core::TimeSeries<core::Candle> bars; // Bars of the signal's instrument
        std::optional<double> last_price;
        // Breadth across the watched universe (vs. session open)
        int advancing = 0;
        int declining = 0;
        int unchanged = 0;
    };

    struct LevelResult {
        bool passed = true;
        std::string reason;

        static LevelResult pass(std::string reason = "ok") { return {true, std::move(reason)}; }
        static LevelResult block(std::string reason) { return {false, std::move(reason)}; }
    };

    class IScreeningLevel {
    public:
        virtual ~IScreeningLevel() = default;

        virtual std::string name() const = 0;

        // Critical levels always block on failure or internal error
        virtual bool isCritical() const { return false; }

        // May throw; the pipeline turns exceptions into internal errors
        virtual LevelResult evaluate(const core::Signal& signal,
                                     const MarketState& state,
                                     const std::vector<core::Position>& open_positions) const = 0;
    };

} // namespace screening
