#pragma once

#include <set>
#include <string>
#include <vector>

#include "screening_level.hpp"
#include "indicators.hpp"

namespace screening {

    // --- Critical levels ---

    // Value-at-risk budget: each open position and the new trade consume a fixed share
    class PortfolioRiskLevel : public IScreeningLevel {
    public:
        PortfolioRiskLevel(double var_per_position = 0.05, double max_portfolio_var = 0.15);
        std::string name() const override { return "portfolio_risk"; }
        bool isCritical() const override { return true; }
        LevelResult evaluate(const core::Signal& signal, const MarketState& state,
                             const std::vector<core::Position>& open_positions) const override;
    private:
        double var_per_position_;
        double max_portfolio_var_;
    };

    class MaxPositionsLevel : public IScreeningLevel {
    public:
        explicit MaxPositionsLevel(int max_positions);
        std::string name() const override { return "max_positions"; }
        bool isCritical() const override { return true; }
        LevelResult evaluate(const core::Signal& signal, const MarketState& state,
                             const std::vector<core::Position>& open_positions) const override;
    private:
        int max_positions_;
    };

    class SymbolBlacklistLevel : public IScreeningLevel {
    public:
        explicit SymbolBlacklistLevel(std::set<std::string> blacklist);
        std::string name() const override { return "symbol_blacklist"; }
        bool isCritical() const override { return true; }
        LevelResult evaluate(const core::Signal& signal, const MarketState& state,
                             const std::vector<core::Position>& open_positions) const override;
    private:
        std::set<std::string> blacklist_;
    };

    // --- Advisory levels ---

    class RiskRewardLevel : public IScreeningLevel {
    public:
        explicit RiskRewardLevel(double min_reward_risk = 1.5);
        std::string name() const override { return "risk_reward"; }
        LevelResult evaluate(const core::Signal& signal, const MarketState& state,
                             const std::vector<core::Position>& open_positions) const override;
    private:
        double min_reward_risk_;
    };

    // Fast/slow EMA must agree with the signal direction
    class TrendAlignmentLevel : public IScreeningLevel {
    public:
        struct Params {
            int fast_period = 25;
            int slow_period = 50;
            int crossover_lookback = 5;     // A crossover this recent counts as aligned
            double min_separation = 0.005;  // Otherwise the EMAs must be this far apart
            std::set<std::string> exempt_strategies{"mean_reversion"};
        };

        TrendAlignmentLevel(const indicators::IIndicatorLibrary& indicators, Params params);
        std::string name() const override { return "trend_alignment"; }
        LevelResult evaluate(const core::Signal& signal, const MarketState& state,
                             const std::vector<core::Position>& open_positions) const override;
    private:
        const indicators::IIndicatorLibrary& indicators_;
        Params params_;
    };

    // Blocks entries while the bands are squeezed (no volatility to trade)
    class BollingerSqueezeLevel : public IScreeningLevel {
    public:
        BollingerSqueezeLevel(const indicators::IIndicatorLibrary& indicators,
                              int period = 20, double deviations = 2.0, double min_width = 0.02);
        std::string name() const override { return "bollinger_squeeze"; }
        LevelResult evaluate(const core::Signal& signal, const MarketState& state,
                             const std::vector<core::Position>& open_positions) const override;
    private:
        const indicators::IIndicatorLibrary& indicators_;
        int period_;
        double deviations_;
        double min_width_;
    };

    // Classic floor pivots from the previous session
    struct PivotLevels {
        double pivot = 0.0;
        double r1 = 0.0, r2 = 0.0;
        double s1 = 0.0, s2 = 0.0;
    };

    class SupportResistanceLevel : public IScreeningLevel {
    public:
        explicit SupportResistanceLevel(double proximity = 0.005);
        std::string name() const override { return "support_resistance"; }
        LevelResult evaluate(const core::Signal& signal, const MarketState& state,
                             const std::vector<core::Position>& open_positions) const override;

        // Pivots from the most recent complete session before the last bar, nullopt without one
        static std::optional<PivotLevels> previousSessionPivots(const core::TimeSeries<core::Candle>& bars);
    private:
        double proximity_;
    };

    struct PriceGap {
        std::size_t bar_index = 0;
        double previous_close = 0.0;
        double open = 0.0;
        double level = 0.0; // Midpoint
        bool gap_up = false;
        bool filled = false;
    };

    class GapAnalysisLevel : public IScreeningLevel {
    public:
        GapAnalysisLevel(double min_gap = 0.003, int lookback = 20, double proximity = 0.01);
        std::string name() const override { return "gap_analysis"; }
        LevelResult evaluate(const core::Signal& signal, const MarketState& state,
                             const std::vector<core::Position>& open_positions) const override;

        std::vector<PriceGap> findGaps(const core::TimeSeries<core::Candle>& bars) const;
    private:
        double min_gap_;
        int lookback_;
        double proximity_;
    };

    // Blocks when the signal bar is among the narrowest of the recent bars
    class NarrowRangeLevel : public IScreeningLevel {
    public:
        NarrowRangeLevel(int lookback = 10, double percentile = 0.2);
        std::string name() const override { return "narrow_range"; }
        LevelResult evaluate(const core::Signal& signal, const MarketState& state,
                             const std::vector<core::Position>& open_positions) const override;
    private:
        int lookback_;
        double percentile_;
    };

    enum class BreadthState { Bullish, Bearish, Neutral };

    class MarketBreadthLevel : public IScreeningLevel {
    public:
        MarketBreadthLevel(double bullish_threshold = 0.3, double bearish_threshold = -0.3,
                           double neutral_tolerance = 0.1);
        std::string name() const override { return "market_breadth"; }
        LevelResult evaluate(const core::Signal& signal, const MarketState& state,
                             const std::vector<core::Position>& open_positions) const override;

        BreadthState classify(double ratio) const;
    private:
        double bullish_threshold_;
        double bearish_threshold_;
        double neutral_tolerance_;
    };

    // Averages trend, momentum, volume, volatility and reward:risk sub-scores (0..100 each)
    class HeuristicScoreLevel : public IScreeningLevel {
    public:
        HeuristicScoreLevel(const indicators::IIndicatorLibrary& indicators, double min_score = 60.0);
        std::string name() const override { return "heuristic_score"; }
        LevelResult evaluate(const core::Signal& signal, const MarketState& state,
                             const std::vector<core::Position>& open_positions) const override;

        double score(const core::Signal& signal, const MarketState& state) const;
    private:
        const indicators::IIndicatorLibrary& indicators_;
        double min_score_;
    };

    // Anti-chasing: the live price must still be near the signal's entry
    class EntryTimingLevel : public IScreeningLevel {
    public:
        EntryTimingLevel(double max_entry_drift = 0.003, double chase_limit = 0.01, int lookback = 5);
        std::string name() const override { return "entry_timing"; }
        LevelResult evaluate(const core::Signal& signal, const MarketState& state,
                             const std::vector<core::Position>& open_positions) const override;
    private:
        double max_entry_drift_;
        double chase_limit_;
        int lookback_;
    };

} // namespace screening
