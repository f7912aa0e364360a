#include "screening_levels.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace screening {

namespace {

    double lastIndicator(const indicators::IIndicatorLibrary& indicators,
                         const core::TimeSeries<core::Candle>& bars,
                         const std::string& name)
    {
        double value = indicators::lastValue(indicators.compute(bars, name));
        if (std::isnan(value)) {
            throw core::DataException(fmt::format("{} not available ({} bars)", name, bars.size()));
        }
        return value;
    }

    double referencePrice(const core::Signal& signal, const MarketState& state) {
        return state.last_price.value_or(signal.entry_price);
    }

    bool isNear(double price, double level, double proximity) {
        return level > 0.0 && std::abs(price - level) / level <= proximity;
    }

} // end anonymous namespace

// --- Portfolio risk ---

PortfolioRiskLevel::PortfolioRiskLevel(double var_per_position, double max_portfolio_var)
    : var_per_position_(var_per_position), max_portfolio_var_(max_portfolio_var)
{
    if (var_per_position_ <= 0.0 || max_portfolio_var_ <= 0.0) {
        throw core::ConfigException("portfolio_risk: VaR parameters must be positive.");
    }
}

LevelResult PortfolioRiskLevel::evaluate(const core::Signal&, const MarketState&,
                                         const std::vector<core::Position>& open_positions) const
{
    double projected = var_per_position_ * static_cast<double>(open_positions.size() + 1);
    // Small epsilon so that exactly hitting the budget is allowed
    if (projected > max_portfolio_var_ + 1e-9) {
        return LevelResult::block(fmt::format("Portfolio VaR {:.1f}% would exceed limit {:.1f}% ({} open)",
                                              projected * 100.0, max_portfolio_var_ * 100.0, open_positions.size()));
    }
    return LevelResult::pass(fmt::format("Portfolio VaR {:.1f}% within {:.1f}%", projected * 100.0, max_portfolio_var_ * 100.0));
}

// --- Max positions ---

MaxPositionsLevel::MaxPositionsLevel(int max_positions) : max_positions_(max_positions) {
    if (max_positions_ <= 0) {
        throw core::ConfigException("max_positions must be positive.");
    }
}

LevelResult MaxPositionsLevel::evaluate(const core::Signal&, const MarketState&,
                                        const std::vector<core::Position>& open_positions) const
{
    if (static_cast<int>(open_positions.size()) >= max_positions_) {
        return LevelResult::block(fmt::format("{} open positions, limit {}", open_positions.size(), max_positions_));
    }
    return LevelResult::pass();
}

// --- Blacklist ---

SymbolBlacklistLevel::SymbolBlacklistLevel(std::set<std::string> blacklist) : blacklist_(std::move(blacklist)) {}

LevelResult SymbolBlacklistLevel::evaluate(const core::Signal& signal, const MarketState&,
                                           const std::vector<core::Position>&) const
{
    if (blacklist_.count(signal.instrument_key) > 0) {
        return LevelResult::block(fmt::format("{} is blacklisted", signal.instrument_key));
    }
    return LevelResult::pass();
}

// --- Reward:risk ---

RiskRewardLevel::RiskRewardLevel(double min_reward_risk) : min_reward_risk_(min_reward_risk) {}

LevelResult RiskRewardLevel::evaluate(const core::Signal& signal, const MarketState&,
                                      const std::vector<core::Position>&) const
{
    if (signal.riskPerUnit() <= 0.0) {
        return LevelResult::block("Signal has no risk distance");
    }
    bool target_on_right_side = signal.direction == core::Direction::Long ? signal.target > signal.entry_price
                                                                          : signal.target < signal.entry_price;
    if (!target_on_right_side) {
        return LevelResult::block("Target is on the wrong side of entry");
    }
    double rr = signal.rewardToRisk();
    if (rr < min_reward_risk_) {
        return LevelResult::block(fmt::format("R:R {:.2f} below minimum {:.2f}", rr, min_reward_risk_));
    }
    return LevelResult::pass(fmt::format("R:R {:.2f}", rr));
}

// --- Trend alignment ---

TrendAlignmentLevel::TrendAlignmentLevel(const indicators::IIndicatorLibrary& indicators, Params params)
    : indicators_(indicators), params_(std::move(params))
{
    if (params_.fast_period <= 0 || params_.slow_period <= params_.fast_period) {
        throw core::ConfigException("trend_alignment: need 0 < fast_period < slow_period.");
    }
}

LevelResult TrendAlignmentLevel::evaluate(const core::Signal& signal, const MarketState& state,
                                          const std::vector<core::Position>&) const
{
    if (params_.exempt_strategies.count(signal.strategy_id) > 0) {
        return LevelResult::pass(fmt::format("{} is exempt", signal.strategy_id));
    }

    auto fast = indicators_.compute(state.bars, fmt::format("EMA({})", params_.fast_period));
    auto slow = indicators_.compute(state.bars, fmt::format("EMA({})", params_.slow_period));
    double fast_now = indicators::lastValue(fast);
    double slow_now = indicators::lastValue(slow);
    if (std::isnan(fast_now) || std::isnan(slow_now) || slow_now == 0.0) {
        throw core::DataException("EMA values not available for trend alignment");
    }

    bool is_long = signal.direction == core::Direction::Long;
    bool aligned = is_long ? fast_now > slow_now : fast_now < slow_now;
    if (!aligned) {
        return LevelResult::block(fmt::format("EMA{} {:.2f} vs EMA{} {:.2f} against {}", params_.fast_period, fast_now,
                                              params_.slow_period, slow_now, core::directionToString(signal.direction)));
    }

    // A fresh crossover is enough, otherwise require clear separation
    std::size_t n = std::min(fast.size(), slow.size());
    std::size_t window = static_cast<std::size_t>(std::max(params_.crossover_lookback, 1));
    for (std::size_t i = n > window + 1 ? n - window - 1 : 0; i + 1 < n; ++i) {
        double before = fast[i] - slow[i];
        double after = fast[i + 1] - slow[i + 1];
        if (std::isnan(before) || std::isnan(after)) continue;
        bool crossed = is_long ? (before <= 0.0 && after > 0.0) : (before >= 0.0 && after < 0.0);
        if (crossed) {
            return LevelResult::pass("Recent EMA crossover");
        }
    }

    double separation = std::abs(fast_now - slow_now) / slow_now;
    if (separation < params_.min_separation) {
        return LevelResult::block(fmt::format("EMA separation {:.2f}% below {:.2f}%", separation * 100.0, params_.min_separation * 100.0));
    }
    return LevelResult::pass(fmt::format("EMA separation {:.2f}%", separation * 100.0));
}

// --- Bollinger squeeze ---

BollingerSqueezeLevel::BollingerSqueezeLevel(const indicators::IIndicatorLibrary& indicators,
                                             int period, double deviations, double min_width)
    : indicators_(indicators), period_(period), deviations_(deviations), min_width_(min_width) {}

LevelResult BollingerSqueezeLevel::evaluate(const core::Signal&, const MarketState& state,
                                            const std::vector<core::Position>&) const
{
    double upper = lastIndicator(indicators_, state.bars, fmt::format("BB_UPPER({},{})", period_, deviations_));
    double middle = lastIndicator(indicators_, state.bars, fmt::format("BB_MIDDLE({},{})", period_, deviations_));
    double lower = lastIndicator(indicators_, state.bars, fmt::format("BB_LOWER({},{})", period_, deviations_));
    if (middle <= 0.0) {
        throw core::DataException("Bollinger middle band is not positive");
    }
    double width = (upper - lower) / middle;
    if (width < min_width_) {
        return LevelResult::block(fmt::format("Bollinger squeeze: width {:.2f}% < {:.2f}%", width * 100.0, min_width_ * 100.0));
    }
    return LevelResult::pass(fmt::format("Band width {:.2f}%", width * 100.0));
}

// --- Support / resistance ---

SupportResistanceLevel::SupportResistanceLevel(double proximity) : proximity_(proximity) {}

std::optional<PivotLevels> SupportResistanceLevel::previousSessionPivots(const core::TimeSeries<core::Candle>& bars) {
    if (bars.empty()) return std::nullopt;

    std::string current_session = core::utils::exchangeDate(bars.back().timestamp);
    auto it = bars.rbegin();
    while (it != bars.rend() && core::utils::exchangeDate(it->timestamp) == current_session) ++it;
    if (it == bars.rend()) return std::nullopt;

    std::string previous_session = core::utils::exchangeDate(it->timestamp);
    double high = it->high;
    double low = it->low;
    double close = it->close; // Last bar of that session
    for (; it != bars.rend() && core::utils::exchangeDate(it->timestamp) == previous_session; ++it) {
        high = std::max(high, it->high);
        low = std::min(low, it->low);
    }

    PivotLevels p;
    p.pivot = (high + low + close) / 3.0;
    p.r1 = 2.0 * p.pivot - low;
    p.s1 = 2.0 * p.pivot - high;
    p.r2 = p.pivot + (high - low);
    p.s2 = p.pivot - (high - low);
    return p;
}

LevelResult SupportResistanceLevel::evaluate(const core::Signal& signal, const MarketState& state,
                                             const std::vector<core::Position>&) const
{
    auto pivots = previousSessionPivots(state.bars);
    if (!pivots) {
        return LevelResult::pass("No previous session for pivots");
    }
    double price = signal.entry_price;
    if (signal.direction == core::Direction::Long) {
        if (isNear(price, pivots->r1, proximity_)) return LevelResult::block(fmt::format("Entry {:.2f} near resistance R1 {:.2f}", price, pivots->r1));
        if (isNear(price, pivots->r2, proximity_)) return LevelResult::block(fmt::format("Entry {:.2f} near resistance R2 {:.2f}", price, pivots->r2));
    } else {
        if (isNear(price, pivots->s1, proximity_)) return LevelResult::block(fmt::format("Entry {:.2f} near support S1 {:.2f}", price, pivots->s1));
        if (isNear(price, pivots->s2, proximity_)) return LevelResult::block(fmt::format("Entry {:.2f} near support S2 {:.2f}", price, pivots->s2));
    }
    return LevelResult::pass(fmt::format("Clear of pivots (P {:.2f})", pivots->pivot));
}

// --- Gaps ---

GapAnalysisLevel::GapAnalysisLevel(double min_gap, int lookback, double proximity)
    : min_gap_(min_gap), lookback_(lookback), proximity_(proximity) {}

std::vector<PriceGap> GapAnalysisLevel::findGaps(const core::TimeSeries<core::Candle>& bars) const {
    std::vector<PriceGap> gaps;
    if (bars.size() < 2) return gaps;

    std::size_t first = bars.size() > static_cast<std::size_t>(lookback_) ? bars.size() - lookback_ : 1;
    first = std::max<std::size_t>(first, 1);
    for (std::size_t i = first; i < bars.size(); ++i) {
        double prev_close = bars[i - 1].close;
        if (prev_close <= 0.0) continue;
        double gap = std::abs(bars[i].open - prev_close) / prev_close;
        if (gap < min_gap_) continue;

        PriceGap g;
        g.bar_index = i;
        g.previous_close = prev_close;
        g.open = bars[i].open;
        g.level = (bars[i].open + prev_close) / 2.0;
        g.gap_up = bars[i].open > prev_close;
        // Filled once any later bar trades back to the pre-gap close
        for (std::size_t j = i; j < bars.size() && !g.filled; ++j) {
            g.filled = g.gap_up ? bars[j].low <= prev_close : bars[j].high >= prev_close;
        }
        gaps.push_back(g);
    }
    return gaps;
}

LevelResult GapAnalysisLevel::evaluate(const core::Signal& signal, const MarketState& state,
                                       const std::vector<core::Position>&) const
{
    double price = signal.entry_price;
    bool is_long = signal.direction == core::Direction::Long;
    for (const auto& gap : findGaps(state.bars)) {
        if (gap.filled) continue;
        // Unfilled gap ahead of the trade acts as a magnet against it
        bool opposing = is_long ? gap.level > price : gap.level < price;
        if (opposing && isNear(price, gap.level, proximity_)) {
            return LevelResult::block(fmt::format("Unfilled {} gap at {:.2f} within {:.1f}% of entry {:.2f}",
                                                  gap.gap_up ? "up" : "down", gap.level, proximity_ * 100.0, price));
        }
    }
    return LevelResult::pass();
}

// --- Narrow range ---

NarrowRangeLevel::NarrowRangeLevel(int lookback, double percentile) : lookback_(lookback), percentile_(percentile) {
    if (lookback_ < 2 || percentile_ <= 0.0 || percentile_ >= 1.0) {
        throw core::ConfigException("narrow_range: lookback >= 2 and 0 < percentile < 1 required.");
    }
}

LevelResult NarrowRangeLevel::evaluate(const core::Signal&, const MarketState& state,
                                       const std::vector<core::Position>&) const
{
    if (state.bars.size() < static_cast<std::size_t>(lookback_)) {
        throw core::DataException(fmt::format("narrow_range needs {} bars, have {}", lookback_, state.bars.size()));
    }
    std::vector<double> ranges;
    for (auto it = state.bars.end() - lookback_; it != state.bars.end(); ++it) {
        ranges.push_back(it->close > 0.0 ? (it->high - it->low) / it->close : 0.0);
    }
    double current = ranges.back();
    std::vector<double> sorted = ranges;
    std::sort(sorted.begin(), sorted.end());
    std::size_t index = static_cast<std::size_t>(std::floor(percentile_ * static_cast<double>(sorted.size() - 1)));
    double threshold = sorted[index];

    if (current <= threshold) {
        return LevelResult::block(fmt::format("Narrow range bar: {:.3f}% <= p{:.0f} {:.3f}%",
                                              current * 100.0, percentile_ * 100.0, threshold * 100.0));
    }
    return LevelResult::pass();
}

// --- Breadth ---

MarketBreadthLevel::MarketBreadthLevel(double bullish_threshold, double bearish_threshold, double neutral_tolerance)
    : bullish_threshold_(bullish_threshold), bearish_threshold_(bearish_threshold), neutral_tolerance_(neutral_tolerance) {}

BreadthState MarketBreadthLevel::classify(double ratio) const {
    if (ratio > bullish_threshold_) return BreadthState::Bullish;
    if (ratio < bearish_threshold_) return BreadthState::Bearish;
    return BreadthState::Neutral;
}

LevelResult MarketBreadthLevel::evaluate(const core::Signal& signal, const MarketState& state,
                                         const std::vector<core::Position>&) const
{
    int total = state.advancing + state.declining + state.unchanged;
    if (total == 0) {
        return LevelResult::pass("No breadth data");
    }
    double ratio = static_cast<double>(state.advancing - state.declining) / total;
    BreadthState breadth = classify(ratio);

    if (signal.direction == core::Direction::Long) {
        if (breadth == BreadthState::Bearish || (breadth == BreadthState::Neutral && ratio < -neutral_tolerance_)) {
            return LevelResult::block(fmt::format("Breadth {:.2f} against long ({} adv / {} dec)", ratio, state.advancing, state.declining));
        }
    } else {
        if (breadth == BreadthState::Bullish || (breadth == BreadthState::Neutral && ratio > neutral_tolerance_)) {
            return LevelResult::block(fmt::format("Breadth {:.2f} against short ({} adv / {} dec)", ratio, state.advancing, state.declining));
        }
    }
    return LevelResult::pass(fmt::format("Breadth {:.2f}", ratio));
}

// --- Heuristic score ---

HeuristicScoreLevel::HeuristicScoreLevel(const indicators::IIndicatorLibrary& indicators, double min_score)
    : indicators_(indicators), min_score_(min_score) {}

double HeuristicScoreLevel::score(const core::Signal& signal, const MarketState& state) const {
    bool is_long = signal.direction == core::Direction::Long;
    double price = referencePrice(signal, state);

    // Trend
    double sma_fast = lastIndicator(indicators_, state.bars, "SMA(10)");
    double sma_slow = lastIndicator(indicators_, state.bars, "SMA(50)");
    bool ma_aligned = is_long ? sma_fast > sma_slow : sma_fast < sma_slow;
    bool price_aligned = is_long ? price > sma_fast : price < sma_fast;
    double trend = ma_aligned ? (price_aligned ? 100.0 : 70.0) : (price_aligned ? 40.0 : 10.0);

    // Momentum
    double rsi = lastIndicator(indicators_, state.bars, "RSI(14)");
    double momentum;
    if (is_long) {
        momentum = (rsi >= 40.0 && rsi <= 70.0) ? 100.0 : (rsi >= 30.0 && rsi <= 80.0) ? 60.0 : 20.0;
    } else {
        momentum = (rsi >= 30.0 && rsi <= 60.0) ? 100.0 : (rsi >= 20.0 && rsi <= 70.0) ? 60.0 : 20.0;
    }

    // Volume vs. 20-bar average
    double volume = 50.0;
    if (state.bars.size() >= 21) {
        double sum = 0.0;
        for (auto it = state.bars.end() - 21; it != state.bars.end() - 1; ++it) sum += static_cast<double>(it->volume);
        double average = sum / 20.0;
        if (average > 0.0) {
            double ratio = static_cast<double>(state.bars.back().volume) / average;
            volume = ratio >= 1.5 ? 100.0 : ratio >= 1.0 ? 70.0 : 40.0;
        }
    }

    // Volatility
    double atr = lastIndicator(indicators_, state.bars, "ATR(14)");
    double atr_pct = price > 0.0 ? atr / price : 0.0;
    double volatility = (atr_pct >= 0.005 && atr_pct <= 0.03) ? 100.0 : atr_pct < 0.005 ? 50.0 : 30.0;

    double reward_risk = std::min(100.0, signal.rewardToRisk() / 3.0 * 100.0);

    return (trend + momentum + volume + volatility + reward_risk) / 5.0;
}

LevelResult HeuristicScoreLevel::evaluate(const core::Signal& signal, const MarketState& state,
                                          const std::vector<core::Position>&) const
{
    double s = score(signal, state);
    if (s < min_score_) {
        return LevelResult::block(fmt::format("Heuristic score {:.1f} below {:.1f}", s, min_score_));
    }
    return LevelResult::pass(fmt::format("Heuristic score {:.1f}", s));
}

// --- Entry timing ---

EntryTimingLevel::EntryTimingLevel(double max_entry_drift, double chase_limit, int lookback)
    : max_entry_drift_(max_entry_drift), chase_limit_(chase_limit), lookback_(lookback) {}

LevelResult EntryTimingLevel::evaluate(const core::Signal& signal, const MarketState& state,
                                       const std::vector<core::Position>&) const
{
    if (!state.last_price) {
        return LevelResult::pass("No live price");
    }
    double price = *state.last_price;
    bool is_long = signal.direction == core::Direction::Long;

    if (!state.bars.empty()) {
        std::size_t count = std::min(state.bars.size(), static_cast<std::size_t>(std::max(lookback_, 1)));
        double recent_high = state.bars.back().high;
        double recent_low = state.bars.back().low;
        for (auto it = state.bars.end() - count; it != state.bars.end(); ++it) {
            recent_high = std::max(recent_high, it->high);
            recent_low = std::min(recent_low, it->low);
        }
        if (is_long && price > recent_high * (1.0 + chase_limit_)) {
            return LevelResult::block(fmt::format("Chasing: {:.2f} is > {:.1f}% above {}-bar high {:.2f}",
                                                  price, chase_limit_ * 100.0, count, recent_high));
        }
        if (!is_long && price < recent_low * (1.0 - chase_limit_)) {
            return LevelResult::block(fmt::format("Chasing: {:.2f} is > {:.1f}% below {}-bar low {:.2f}",
                                                  price, chase_limit_ * 100.0, count, recent_low));
        }
    }

    // Retest entries are timed by the wait queue
    if (signal.requires_retest) {
        return LevelResult::pass("Timed by retest");
    }

    double drift = (price - signal.entry_price) / signal.entry_price;
    if ((is_long && drift > max_entry_drift_) || (!is_long && -drift > max_entry_drift_)) {
        return LevelResult::block(fmt::format("Price {:.2f} drifted {:.2f}% past entry {:.2f}",
                                              price, std::abs(drift) * 100.0, signal.entry_price));
    }
    return LevelResult::pass();
}

} // namespace screening
