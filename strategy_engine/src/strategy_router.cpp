#include "strategy_router.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace strategy_engine {

StrategyRouter::StrategyRouter(core::RouterConfig config,
                               const indicators::IIndicatorLibrary& indicators,
                               const core::SessionCalendar& calendar,
                               std::unique_ptr<ISignalGenerator> mean_reversion,
                               std::unique_ptr<ISignalGenerator> breakout)
    : config_(std::move(config)),
      indicators_(indicators),
      calendar_(calendar),
      mean_reversion_(std::move(mean_reversion)),
      breakout_(std::move(breakout))
{
    if (!mean_reversion_ || !breakout_) {
        throw core::ConfigException("StrategyRouter requires both a mean reversion and a breakout generator.");
    }
    if (mean_reversion_->kind() != GeneratorKind::MeanReversion || breakout_->kind() != GeneratorKind::Breakout) {
        throw core::ConfigException("StrategyRouter generators were passed in the wrong slots.");
    }
    core::logging::getLogger()->info("StrategyRouter: regime '{}' threshold {}, min history {} bars.",
                                     config_.regime_indicator, config_.regime_threshold, config_.min_history_bars);
}

GeneratorKind StrategyRouter::selectGenerator(double regime_value) const {
    return regime_value < config_.regime_threshold ? GeneratorKind::MeanReversion : GeneratorKind::Breakout;
}

const ISignalGenerator& StrategyRouter::generatorFor(GeneratorKind kind) const {
    return kind == GeneratorKind::MeanReversion ? *mean_reversion_ : *breakout_;
}

std::optional<core::Signal> StrategyRouter::evaluate(const std::string& instrument_key,
                                                     const core::TimeSeries<core::Candle>& bars,
                                                     const core::Timestamp& now) const
{
    if (bars.size() < config_.min_history_bars) {
        throw core::DataException(fmt::format("{} has {} bars, need {}", instrument_key, bars.size(), config_.min_history_bars));
    }

    double regime = indicators::lastValue(indicators_.compute(bars, config_.regime_indicator));
    if (std::isnan(regime)) {
        throw core::DataException(fmt::format("{} regime value {} is NaN", instrument_key, config_.regime_indicator));
    }

    const ISignalGenerator& generator = generatorFor(selectGenerator(regime));
    core::logging::getLogger()->trace("{}: {}={:.2f} -> {}", instrument_key, config_.regime_indicator, regime, generator.getName());

    MarketContext context;
    context.instrument_key = instrument_key;
    context.bars = &bars;
    context.now = now;
    context.regime_value = regime;

    auto signal = generator.generateSignal(context);
    if (signal && signal->riskPerUnit() <= 0.0) {
        core::logging::getLogger()->warn("{} produced a zero-risk signal for {}, discarding.", generator.getName(), instrument_key);
        return std::nullopt;
    }
    return signal;
}

RouterCycleResult StrategyRouter::runCycle(const std::vector<std::string>& instruments,
                                           const market_data::CandleAggregator& aggregator,
                                           const core::Timestamp& now,
                                           const OccupancyCheck& is_occupied) const
{
    auto logger = core::logging::getLogger();
    RouterCycleResult result;

    // Blackout is checked before any indicator work
    if (!calendar_.acceptsEntries(now)) {
        result.blackout = true;
        logger->debug("Strategy cycle skipped at {}: outside entry hours or in blackout.", core::utils::timestampToString(now));
        return result;
    }

    for (const auto& instrument : instruments) {
        if (is_occupied && is_occupied(instrument)) {
            ++result.skipped_occupied;
            continue;
        }

        auto bars = aggregator.snapshot(instrument);
        if (bars.size() < config_.min_history_bars) {
            ++result.skipped_history;
            logger->trace("{}: insufficient history ({} < {}).", instrument, bars.size(), config_.min_history_bars);
            continue;
        }

        ++result.evaluated;
        try {
            auto signal = evaluate(instrument, bars, now);
            if (signal) {
                logger->info("Signal: {} {} @ {:.2f} SL {:.2f} TGT {:.2f} conf {:.0f} [{}]",
                             signal->instrument_key, core::directionToString(signal->direction),
                             signal->entry_price, signal->stop_loss, signal->target,
                             signal->confidence, signal->strategy_id);
                result.signals.push_back(std::move(*signal));
            }
        } catch (const core::DataException& e) {
            ++result.skipped_data;
            logger->debug("Skipping {} this cycle: {}", instrument, e.what());
        } catch (const core::StrategyException& e) {
            ++result.generator_errors;
            logger->error("Generator error for {}: {}", instrument, e.what());
        }
    }

    std::size_t signal_count = result.signals.size();
    result.signals = rankSignals(std::move(result.signals), signal_count);
    return result;
}

std::vector<core::Signal> StrategyRouter::rankSignals(std::vector<core::Signal> signals, std::size_t max_count) {
    std::stable_sort(signals.begin(), signals.end(), [](const core::Signal& a, const core::Signal& b) {
        return a.confidence * a.rewardToRisk() > b.confidence * b.rewardToRisk();
    });
    if (signals.size() > max_count) {
        signals.resize(max_count);
    }
    return signals;
}

} // namespace strategy_engine
