#include "mean_reversion_generator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace strategy_engine {

MeanReversionGenerator::MeanReversionGenerator(MeanReversionParams params,
                                               const indicators::IIndicatorLibrary& indicators)
    : params_(params), indicators_(indicators)
{
    if (params_.bb_period <= 1 || params_.rsi_period <= 1 || params_.atr_period <= 0) {
        throw core::StrategyException("Mean reversion periods must be positive (bands and RSI need at least 2 bars).");
    }
    if (params_.bb_deviations <= 0.0 || params_.atr_stop_multiplier <= 0.0 || params_.reward_risk <= 0.0) {
        throw core::StrategyException("Mean reversion multipliers must be positive.");
    }
    if (params_.rsi_oversold >= params_.rsi_overbought) {
        throw core::StrategyException(fmt::format("RSI oversold ({}) must be below overbought ({}).",
                                                  params_.rsi_oversold, params_.rsi_overbought));
    }
}

std::size_t MeanReversionGenerator::requiredHistory() const {
    return static_cast<std::size_t>(std::max({params_.bb_period, params_.rsi_period + 1, params_.atr_period + 1}));
}

std::optional<core::Signal> MeanReversionGenerator::generateSignal(const MarketContext& context) const {
    if (context.bars == nullptr || context.bars->size() < requiredHistory()) {
        return std::nullopt;
    }
    const auto& bars = *context.bars;
    const core::Candle& last = bars.back();

    double upper = indicators::lastValue(indicators_.compute(bars, fmt::format("BB_UPPER({},{})", params_.bb_period, params_.bb_deviations)));
    double lower = indicators::lastValue(indicators_.compute(bars, fmt::format("BB_LOWER({},{})", params_.bb_period, params_.bb_deviations)));
    double rsi = indicators::lastValue(indicators_.compute(bars, fmt::format("RSI({})", params_.rsi_period)));
    double atr = indicators::lastValue(indicators_.compute(bars, fmt::format("ATR({})", params_.atr_period)));

    if (std::isnan(upper) || std::isnan(lower) || std::isnan(rsi) || std::isnan(atr)) {
        throw core::DataException(fmt::format("Mean reversion indicators not ready for {}", context.instrument_key));
    }
    if (atr <= 0.0) {
        return std::nullopt; // Flat market, no meaningful stop distance
    }

    core::Signal signal;
    signal.timestamp = context.now;
    signal.instrument_key = context.instrument_key;
    signal.entry_price = last.close;
    signal.strategy_id = getName();

    double stop_distance = params_.atr_stop_multiplier * atr;

    if (last.close <= lower && rsi < params_.rsi_oversold) {
        signal.direction = core::Direction::Long;
        signal.stop_loss = last.close - stop_distance;
        signal.target = last.close + params_.reward_risk * stop_distance;
        // Deeper oversold -> higher confidence
        signal.confidence = std::clamp(50.0 + (params_.rsi_oversold - rsi) * 2.5, 0.0, 100.0);
        signal.rationale = fmt::format("Close {:.2f} at/below lower band {:.2f}, RSI {:.1f} < {:.0f}",
                                       last.close, lower, rsi, params_.rsi_oversold);
    } else if (last.close >= upper && rsi > params_.rsi_overbought) {
        signal.direction = core::Direction::Short;
        signal.stop_loss = last.close + stop_distance;
        signal.target = last.close - params_.reward_risk * stop_distance;
        signal.confidence = std::clamp(50.0 + (rsi - params_.rsi_overbought) * 2.5, 0.0, 100.0);
        signal.rationale = fmt::format("Close {:.2f} at/above upper band {:.2f}, RSI {:.1f} > {:.0f}",
                                       last.close, upper, rsi, params_.rsi_overbought);
    } else {
        return std::nullopt;
    }

    core::logging::getLogger()->debug("[{}] {} {} signal: {}", getName(), context.instrument_key,
                                      core::directionToString(signal.direction), signal.rationale);
    return signal;
}

} // namespace strategy_engine
