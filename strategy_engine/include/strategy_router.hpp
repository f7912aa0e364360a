#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "signal_generator.hpp"
#include "engine_config.hpp"
#include "session_calendar.hpp"
#include "indicators.hpp"
#include "candle_aggregator.hpp"

namespace strategy_engine {

    struct RouterCycleResult {
        std::vector<core::Signal> signals; // Ranked, best first
        bool blackout = false;
        int evaluated = 0;
        int skipped_occupied = 0;
        int skipped_history = 0;
        int skipped_data = 0;
        int generator_errors = 0;
    };

    // Classifies each instrument's regime and dispatches to exactly one generator.
    class StrategyRouter {
    public:
        // True when the instrument already holds a position, pending retest or in-flight entry
        using OccupancyCheck = std::function<bool(const std::string&)>;

        StrategyRouter(core::RouterConfig config,
                       const indicators::IIndicatorLibrary& indicators,
                       const core::SessionCalendar& calendar,
                       std::unique_ptr<ISignalGenerator> mean_reversion,
                       std::unique_ptr<ISignalGenerator> breakout);

        // Regime below threshold -> mean reversion, at/above -> breakout
        GeneratorKind selectGenerator(double regime_value) const;

        // Single instrument. Throws core::DataException for short history or a NaN regime.
        std::optional<core::Signal> evaluate(const std::string& instrument_key,
                                             const core::TimeSeries<core::Candle>& bars,
                                             const core::Timestamp& now) const;

        // One strategy cycle over the instruments, reading bars from the aggregator
        RouterCycleResult runCycle(const std::vector<std::string>& instruments,
                                   const market_data::CandleAggregator& aggregator,
                                   const core::Timestamp& now,
                                   const OccupancyCheck& is_occupied) const;

        // Sorts by confidence x reward:risk, descending, and keeps at most max_count
        static std::vector<core::Signal> rankSignals(std::vector<core::Signal> signals, std::size_t max_count);

        const core::RouterConfig& config() const { return config_; }

    private:
        const ISignalGenerator& generatorFor(GeneratorKind kind) const;

        core::RouterConfig config_;
        const indicators::IIndicatorLibrary& indicators_;
        const core::SessionCalendar& calendar_;
        std::unique_ptr<ISignalGenerator> mean_reversion_;
        std::unique_ptr<ISignalGenerator> breakout_;
    };

} // namespace strategy_engine
