#pragma once

#include <memory>
#include <nlohmann/json.hpp>

#include "signal_generator.hpp"
#include "indicators.hpp"

namespace strategy_engine {

    using json = nlohmann::json;

    // One generator per regime
    struct GeneratorSet {
        std::unique_ptr<ISignalGenerator> mean_reversion;
        std::unique_ptr<ISignalGenerator> breakout;
    };

    class GeneratorFactory {
    public:
        // Creates one generator from its parameter object. Missing keys keep their defaults.
        // Returns nullptr (after logging) on an invalid configuration.
        static std::unique_ptr<ISignalGenerator> createGenerator(GeneratorKind kind,
                                                                 const json& params,
                                                                 const indicators::IIndicatorLibrary& indicators);

        // Builds both generators from {"mean_reversion": {...}, "breakout": {...}}.
        // Throws core::ConfigException when either one cannot be built.
        static GeneratorSet createGenerators(const json& config, const indicators::IIndicatorLibrary& indicators);
    };

} // namespace strategy_engine
