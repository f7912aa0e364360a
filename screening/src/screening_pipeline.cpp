#include "screening_pipeline.hpp"
#include "screening_levels.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <algorithm>
#include <map>
#include <set>

namespace screening {

ScreeningPipeline::ScreeningPipeline(bool fail_open, audit::IAuditPublisher* publisher)
    : fail_open_(fail_open), publisher_(publisher) {}

void ScreeningPipeline::addLevel(std::unique_ptr<IScreeningLevel> level, bool enabled, std::optional<bool> fail_open) {
    if (!level) {
        throw core::ConfigException("Cannot add a null screening level.");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : levels_) {
        if (entry.level->name() == level->name()) {
            throw core::ConfigException(fmt::format("Screening level '{}' added twice.", level->name()));
        }
    }
    core::logging::getLogger()->debug("Screening level '{}' added ({}, {}{}).", level->name(),
                                      level->isCritical() ? "critical" : "advisory",
                                      enabled ? "enabled" : "disabled",
                                      fail_open ? (*fail_open ? ", fail-open" : ", fail-closed") : "");
    levels_.push_back(Entry{std::move(level), enabled, fail_open});
}

bool ScreeningPipeline::setEnabled(const std::string& name, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : levels_) {
        if (entry.level->name() == name) {
            entry.enabled = enabled;
            core::logging::getLogger()->info("Screening level '{}' {}.", name, enabled ? "enabled" : "disabled");
            return true;
        }
    }
    core::logging::getLogger()->warn("setEnabled: unknown screening level '{}'.", name);
    return false;
}

bool ScreeningPipeline::isEnabled(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : levels_) {
        if (entry.level->name() == name) return entry.enabled;
    }
    return false;
}

std::vector<std::string> ScreeningPipeline::levelNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& entry : levels_) names.push_back(entry.level->name());
    return names;
}

std::vector<std::string> ScreeningPipeline::enabledLevelNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& entry : levels_) {
        if (entry.enabled) names.push_back(entry.level->name());
    }
    return names;
}

bool ScreeningPipeline::runLevel(const Entry& entry, const core::Signal& signal, const MarketState& state,
                                 const std::vector<core::Position>& open_positions,
                                 core::ScreeningVerdict& verdict) const
{
    auto logger = core::logging::getLogger();
    core::LevelOutcome outcome;
    outcome.level = entry.level->name();
    outcome.critical = entry.level->isCritical();

    try {
        LevelResult result = entry.level->evaluate(signal, state, open_positions);
        outcome.passed = result.passed;
        outcome.reason = std::move(result.reason);
    } catch (const std::exception& e) {
        outcome.passed = false;
        outcome.internal_error = true;
        outcome.reason = fmt::format("internal error: {}", e.what());
    }

    bool blocks = !outcome.passed;
    if (blocks && !outcome.critical && entry.fail_open.value_or(fail_open_)) {
        blocks = false;
        outcome.fail_open_applied = true;
        logger->warn("[{}] {} ({}): {} - passing (fail-open).", outcome.level, signal.instrument_key,
                     signal.strategy_id, outcome.reason);
    }
    if (outcome.internal_error && (blocks || outcome.critical)) {
        logger->error("[{}] {}: {} - blocking.", outcome.level, signal.instrument_key, outcome.reason);
    }

    if (blocks && !verdict.blocking_level) {
        verdict.passed = false;
        verdict.blocking_level = outcome.level;
        verdict.reason = outcome.reason;
        verdict.is_critical = outcome.critical;
    }
    verdict.outcomes.push_back(std::move(outcome));
    return blocks;
}

core::ScreeningVerdict ScreeningPipeline::validate(const core::Signal& signal,
                                                   const MarketState& state,
                                                   const std::vector<core::Position>& open_positions) const
{
    core::ScreeningVerdict verdict;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // --- Critical levels: all of them, unconditionally ---
        for (const auto& entry : levels_) {
            if (entry.enabled && entry.level->isCritical()) {
                runLevel(entry, signal, state, open_positions, verdict);
            }
        }

        // --- Advisory levels: in order, first block wins ---
        if (verdict.passed) {
            for (const auto& entry : levels_) {
                if (!entry.enabled || entry.level->isCritical()) continue;
                if (runLevel(entry, signal, state, open_positions, verdict)) break;
            }
        }
    }

    auto logger = core::logging::getLogger();
    if (verdict.passed) {
        std::size_t forgiven = std::count_if(verdict.outcomes.begin(), verdict.outcomes.end(),
                                             [](const core::LevelOutcome& o) { return o.fail_open_applied; });
        verdict.reason = forgiven > 0
            ? fmt::format("Passed {} levels ({} by fail-open)", verdict.outcomes.size(), forgiven)
            : fmt::format("Passed {} levels", verdict.outcomes.size());
        logger->info("Screening PASSED {} {} [{}]: {}", signal.instrument_key,
                     core::directionToString(signal.direction), signal.strategy_id, verdict.reason);
    } else {
        logger->info("Screening BLOCKED {} {} [{}] at '{}'{}: {}", signal.instrument_key,
                     core::directionToString(signal.direction), signal.strategy_id,
                     verdict.blocking_level.value_or("?"), verdict.is_critical ? " (critical)" : "",
                     verdict.reason);
    }

    publish(signal, verdict, state.now);
    return verdict;
}

void ScreeningPipeline::publish(const core::Signal& signal, const core::ScreeningVerdict& verdict,
                                const core::Timestamp& now) const
{
    if (publisher_ == nullptr) return;
    audit::AuditEvent event;
    event.timestamp = now;
    event.type = audit::AuditEventType::ScreeningVerdict;
    event.instrument_key = signal.instrument_key;
    event.payload = audit::verdictToJson(verdict);
    event.payload["signal"] = audit::signalToJson(signal);
    publisher_->publish(std::move(event));
}

// --- Presets and construction ---

const std::vector<std::string>& knownLevelNames() {
    static const std::vector<std::string> names = {
        "portfolio_risk", "max_positions", "symbol_blacklist",
        "risk_reward", "trend_alignment", "bollinger_squeeze", "support_resistance",
        "gap_analysis", "narrow_range", "market_breadth", "heuristic_score", "entry_timing"
    };
    return names;
}

std::vector<std::string> presetLevels(const std::string& preset) {
    if (preset == "relaxed") {
        return {"portfolio_risk", "max_positions", "symbol_blacklist"};
    }
    if (preset == "medium") {
        return {"portfolio_risk", "max_positions", "symbol_blacklist", "risk_reward",
                "trend_alignment", "support_resistance", "narrow_range", "heuristic_score"};
    }
    if (preset == "strict") {
        return knownLevelNames();
    }
    throw core::ConfigException(fmt::format("Unknown screening preset '{}' (expected relaxed, medium or strict).", preset));
}

namespace {

    std::unique_ptr<IScreeningLevel> makeLevel(const std::string& name, const core::json& params,
                                               const core::RiskConfig& risk,
                                               const indicators::IIndicatorLibrary& indicators)
    {
        if (name == "portfolio_risk") {
            return std::make_unique<PortfolioRiskLevel>(params.value("var_per_position", 0.05),
                                                        params.value("max_portfolio_var", 0.15));
        }
        if (name == "max_positions") {
            return std::make_unique<MaxPositionsLevel>(params.value("max_positions", risk.max_positions));
        }
        if (name == "symbol_blacklist") {
            return std::make_unique<SymbolBlacklistLevel>(params.value("symbols", std::set<std::string>{}));
        }
        if (name == "risk_reward") {
            return std::make_unique<RiskRewardLevel>(params.value("min_reward_risk", 1.5));
        }
        if (name == "trend_alignment") {
            TrendAlignmentLevel::Params p;
            p.fast_period = params.value("fast_period", p.fast_period);
            p.slow_period = params.value("slow_period", p.slow_period);
            p.crossover_lookback = params.value("crossover_lookback", p.crossover_lookback);
            p.min_separation = params.value("min_separation", p.min_separation);
            p.exempt_strategies = params.value("exempt_strategies", p.exempt_strategies);
            return std::make_unique<TrendAlignmentLevel>(indicators, p);
        }
        if (name == "bollinger_squeeze") {
            return std::make_unique<BollingerSqueezeLevel>(indicators, params.value("period", 20),
                                                           params.value("deviations", 2.0),
                                                           params.value("min_width", 0.02));
        }
        if (name == "support_resistance") {
            return std::make_unique<SupportResistanceLevel>(params.value("proximity", 0.005));
        }
        if (name == "gap_analysis") {
            return std::make_unique<GapAnalysisLevel>(params.value("min_gap", 0.003), params.value("lookback", 20),
                                                      params.value("proximity", 0.01));
        }
        if (name == "narrow_range") {
            return std::make_unique<NarrowRangeLevel>(params.value("lookback", 10), params.value("percentile", 0.2));
        }
        if (name == "market_breadth") {
            return std::make_unique<MarketBreadthLevel>(params.value("bullish_threshold", 0.3),
                                                        params.value("bearish_threshold", -0.3),
                                                        params.value("neutral_tolerance", 0.1));
        }
        if (name == "heuristic_score") {
            return std::make_unique<HeuristicScoreLevel>(indicators, params.value("min_score", 60.0));
        }
        if (name == "entry_timing") {
            return std::make_unique<EntryTimingLevel>(params.value("max_entry_drift", 0.003),
                                                      params.value("chase_limit", 0.01),
                                                      params.value("lookback", 5));
        }
        throw core::ConfigException(fmt::format("Unknown screening level '{}'.", name));
    }

} // end anonymous namespace

std::unique_ptr<ScreeningPipeline> buildPipeline(const core::ScreeningConfig& config,
                                                 const core::RiskConfig& risk,
                                                 const indicators::IIndicatorLibrary& indicators,
                                                 audit::IAuditPublisher* publisher)
{
    auto logger = core::logging::getLogger();
    std::vector<std::string> preset = presetLevels(config.preset);
    std::set<std::string> preset_enabled(preset.begin(), preset.end());

    // Configured levels first, in configured order, then the remaining known levels
    std::vector<std::string> order;
    std::map<std::string, const core::ScreeningLevelConfig*> overrides;
    const auto& known = knownLevelNames();
    for (const auto& level_config : config.levels) {
        if (std::find(known.begin(), known.end(), level_config.name) == known.end()) {
            throw core::ConfigException(fmt::format("Unknown screening level '{}' in configuration.", level_config.name));
        }
        if (overrides.count(level_config.name) > 0) {
            throw core::ConfigException(fmt::format("Screening level '{}' configured twice.", level_config.name));
        }
        overrides[level_config.name] = &level_config;
        order.push_back(level_config.name);
    }
    for (const auto& name : known) {
        if (overrides.count(name) == 0) order.push_back(name);
    }

    auto pipeline = std::make_unique<ScreeningPipeline>(config.fail_open, publisher);
    for (const auto& name : order) {
        bool enabled = preset_enabled.count(name) > 0;
        std::optional<bool> fail_open;
        core::json params = core::json::object();
        auto it = overrides.find(name);
        if (it != overrides.end()) {
            enabled = it->second->enabled.value_or(enabled);
            fail_open = it->second->fail_open;
            params = it->second->params;
        }
        try {
            pipeline->addLevel(makeLevel(name, params, risk, indicators), enabled, fail_open);
        } catch (const core::json::exception& e) {
            throw core::ConfigException(fmt::format("Invalid parameters for screening level '{}': {}", name, e.what()));
        }
    }

    logger->info("Screening pipeline built: preset '{}', {}, enabled levels: {}", config.preset,
                 config.fail_open ? "fail-open" : "fail-closed", fmt::join(pipeline->enabledLevelNames(), ", "));
    return pipeline;
}

} // namespace screening
