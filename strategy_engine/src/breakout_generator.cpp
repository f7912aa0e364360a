#include "breakout_generator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace strategy_engine {

BreakoutGenerator::BreakoutGenerator(BreakoutParams params, const indicators::IIndicatorLibrary& indicators)
    : params_(params), indicators_(indicators)
{
    if (params_.channel_lookback <= 1 || params_.atr_period <= 0) {
        throw core::StrategyException("Breakout lookback must be > 1 and ATR period positive.");
    }
    if (params_.atr_stop_multiplier <= 0.0 || params_.reward_risk <= 0.0 || params_.volume_multiplier < 0.0) {
        throw core::StrategyException("Breakout multipliers must be positive.");
    }
}

std::size_t BreakoutGenerator::requiredHistory() const {
    // Channel excludes the breakout bar itself
    return static_cast<std::size_t>(std::max(params_.channel_lookback + 1, params_.atr_period + 1));
}

std::optional<core::Signal> BreakoutGenerator::generateSignal(const MarketContext& context) const {
    if (context.bars == nullptr || context.bars->size() < requiredHistory()) {
        return std::nullopt;
    }
    const auto& bars = *context.bars;
    const core::Candle& last = bars.back();

    // --- Prior channel ---
    auto channel_begin = bars.end() - 1 - params_.channel_lookback;
    auto channel_end = bars.end() - 1;
    double channel_high = channel_begin->high;
    double channel_low = channel_begin->low;
    double volume_sum = 0.0;
    for (auto it = channel_begin; it != channel_end; ++it) {
        channel_high = std::max(channel_high, it->high);
        channel_low = std::min(channel_low, it->low);
        volume_sum += static_cast<double>(it->volume);
    }
    double average_volume = volume_sum / params_.channel_lookback;

    double atr = indicators::lastValue(indicators_.compute(bars, fmt::format("ATR({})", params_.atr_period)));
    if (std::isnan(atr)) {
        throw core::DataException(fmt::format("ATR not ready for {}", context.instrument_key));
    }
    if (atr <= 0.0) {
        return std::nullopt;
    }

    bool long_break = last.close > channel_high;
    bool short_break = last.close < channel_low;
    if (!long_break && !short_break) {
        return std::nullopt;
    }

    double volume_ratio = average_volume > 0.0 ? static_cast<double>(last.volume) / average_volume : 1.0;
    if (params_.volume_multiplier > 0.0 && average_volume > 0.0 && volume_ratio < params_.volume_multiplier) {
        core::logging::getLogger()->trace("[{}] {} breakout ignored, volume ratio {:.2f} < {:.2f}",
                                          getName(), context.instrument_key, volume_ratio, params_.volume_multiplier);
        return std::nullopt;
    }

    core::Signal signal;
    signal.timestamp = context.now;
    signal.instrument_key = context.instrument_key;
    signal.strategy_id = getName();
    signal.requires_retest = params_.require_retest;

    // With a retest the entry is the broken level, otherwise the breakout close
    double level = long_break ? channel_high : channel_low;
    signal.entry_price = params_.require_retest ? level : last.close;

    double stop_distance = params_.atr_stop_multiplier * atr;
    if (long_break) {
        signal.direction = core::Direction::Long;
        signal.stop_loss = signal.entry_price - stop_distance;
        signal.target = signal.entry_price + params_.reward_risk * stop_distance;
    } else {
        signal.direction = core::Direction::Short;
        signal.stop_loss = signal.entry_price + stop_distance;
        signal.target = signal.entry_price - params_.reward_risk * stop_distance;
    }

    // Stronger trend and heavier volume -> higher confidence
    double trend_bonus = std::isnan(context.regime_value) ? 0.0 : (context.regime_value - 25.0) * 1.5;
    double volume_bonus = std::min(20.0, (volume_ratio - 1.0) * 10.0);
    signal.confidence = std::clamp(55.0 + trend_bonus + volume_bonus, 0.0, 100.0);
    signal.rationale = fmt::format("Close {:.2f} broke {}-bar {} {:.2f} (regime {:.1f}, volume x{:.2f})",
                                   last.close, params_.channel_lookback, long_break ? "high" : "low",
                                   level, context.regime_value, volume_ratio);

    core::logging::getLogger()->debug("[{}] {} {} signal: {}", getName(), context.instrument_key,
                                      core::directionToString(signal.direction), signal.rationale);
    return signal;
}

} // namespace strategy_engine
