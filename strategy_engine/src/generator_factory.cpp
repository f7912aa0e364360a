#include "generator_factory.hpp"
#include "mean_reversion_generator.hpp"
#include "breakout_generator.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

#include <stdexcept>
#include <string>

namespace strategy_engine {

    namespace {

        // Reads an optional numeric field, leaving the default untouched when absent
        template<typename T>
        void readNumber(const json& params, const char* key, T& target) {
            if (!params.contains(key)) return;
            if (!params[key].is_number()) {
                throw std::invalid_argument(fmt::format("'{}' must be a number.", key));
            }
            target = params[key].get<T>();
        }

        void readBool(const json& params, const char* key, bool& target) {
            if (!params.contains(key)) return;
            if (!params[key].is_boolean()) {
                throw std::invalid_argument(fmt::format("'{}' must be a boolean.", key));
            }
            target = params[key].get<bool>();
        }

        MeanReversionParams parseMeanReversion(const json& params) {
            MeanReversionParams p;
            readNumber(params, "bb_period", p.bb_period);
            readNumber(params, "bb_deviations", p.bb_deviations);
            readNumber(params, "rsi_period", p.rsi_period);
            readNumber(params, "rsi_oversold", p.rsi_oversold);
            readNumber(params, "rsi_overbought", p.rsi_overbought);
            readNumber(params, "atr_period", p.atr_period);
            readNumber(params, "atr_stop_multiplier", p.atr_stop_multiplier);
            readNumber(params, "reward_risk", p.reward_risk);
            return p;
        }

        BreakoutParams parseBreakout(const json& params) {
            BreakoutParams p;
            readNumber(params, "channel_lookback", p.channel_lookback);
            readNumber(params, "atr_period", p.atr_period);
            readNumber(params, "atr_stop_multiplier", p.atr_stop_multiplier);
            readNumber(params, "reward_risk", p.reward_risk);
            readNumber(params, "volume_multiplier", p.volume_multiplier);
            readBool(params, "require_retest", p.require_retest);
            return p;
        }

    } // end anonymous namespace

    const char* generatorKindToString(GeneratorKind kind) {
        switch (kind) {
            case GeneratorKind::MeanReversion: return "MEAN_REVERSION";
            case GeneratorKind::Breakout: return "BREAKOUT";
        }
        return "UNKNOWN";
    }

    std::unique_ptr<ISignalGenerator> GeneratorFactory::createGenerator(GeneratorKind kind,
                                                                        const json& params,
                                                                        const indicators::IIndicatorLibrary& indicators)
    {
        auto logger = core::logging::getLogger();
        logger->debug("Creating {} generator from config: {}", generatorKindToString(kind), params.dump());

        try {
            if (!params.is_object()) throw std::invalid_argument("Generator config must be a JSON object.");

            switch (kind) {
                case GeneratorKind::MeanReversion:
                    return std::make_unique<MeanReversionGenerator>(parseMeanReversion(params), indicators);
                case GeneratorKind::Breakout:
                    return std::make_unique<BreakoutGenerator>(parseBreakout(params), indicators);
            }
            throw std::invalid_argument("Unknown generator kind.");

        } catch (const json::exception& e) {
            logger->error("JSON error while creating {} generator: {}", generatorKindToString(kind), e.what());
            return nullptr;
        } catch (const std::invalid_argument& e) {
            logger->error("Invalid {} generator configuration: {}", generatorKindToString(kind), e.what());
            return nullptr;
        } catch (const core::StrategyException& e) {
            logger->error("Rejected {} generator parameters: {}", generatorKindToString(kind), e.what());
            return nullptr;
        }
    }

    GeneratorSet GeneratorFactory::createGenerators(const json& config, const indicators::IIndicatorLibrary& indicators) {
        if (!config.is_null() && !config.is_object()) {
            throw core::ConfigException("'generators' must be a JSON object.");
        }
        auto section = [&config](const char* key) {
            return config.is_object() && config.contains(key) ? config[key] : json::object();
        };

        GeneratorSet set;
        set.mean_reversion = createGenerator(GeneratorKind::MeanReversion, section("mean_reversion"), indicators);
        if (!set.mean_reversion) {
            throw core::ConfigException("Failed to create the mean reversion generator, see log for details.");
        }
        set.breakout = createGenerator(GeneratorKind::Breakout, section("breakout"), indicators);
        if (!set.breakout) {
            throw core::ConfigException("Failed to create the breakout generator, see log for details.");
        }

        core::logging::getLogger()->info("Signal generators ready: {} (range) and {} (trend).",
                                         set.mean_reversion->getName(), set.breakout->getName());
        return set;
    }

} // namespace strategy_engine
