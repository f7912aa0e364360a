#include "engine_config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace core {

    namespace { // File-local parsing helpers

        // Reads obj[key] into out when present. Type mismatches become ConfigException.
        template<typename T>
        void readOptional(const json& obj, const char* key, T& out, const std::string& section) {
            if (!obj.contains(key) || obj.at(key).is_null()) {
                return;
            }
            try {
                out = obj.at(key).get<T>();
            } catch (const json::exception& e) {
                throw ConfigException(fmt::format("Invalid value for '{}.{}': {}", section, key, e.what()));
            }
        }

        template<typename Duration>
        void readDuration(const json& obj, const char* key, Duration& out, const std::string& section) {
            long long raw = out.count();
            readOptional(obj, key, raw, section);
            if (raw < 0) {
                throw ConfigException(fmt::format("'{}.{}' must not be negative", section, key));
            }
            out = Duration(raw);
        }

        const json& section(const json& root, const char* key) {
            static const json empty = json::object();
            if (!root.contains(key)) {
                return empty;
            }
            const json& value = root.at(key);
            if (!value.is_object()) {
                throw ConfigException(fmt::format("Config section '{}' must be an object", key));
            }
            return value;
        }

        void requirePositive(double value, const std::string& name) {
            if (!(value > 0.0)) {
                throw ConfigException(fmt::format("'{}' must be positive (got {})", name, value));
            }
        }

        SessionConfig parseSession(const json& obj) {
            SessionConfig session;
            std::string open = "09:15", close = "15:30", flatten = "15:15";
            readOptional(obj, "market_open", open, "session");
            readOptional(obj, "market_close", close, "session");
            readOptional(obj, "flatten_time", flatten, "session");
            session.market_open_minute = utils::parseTimeOfDay(open);
            session.market_close_minute = utils::parseTimeOfDay(close);
            session.flatten_minute = utils::parseTimeOfDay(flatten);

            if (obj.contains("blackout_windows")) {
                const json& windows = obj.at("blackout_windows");
                if (!windows.is_array()) {
                    throw ConfigException("'session.blackout_windows' must be an array");
                }
                for (const auto& window : windows) {
                    if (!window.is_object() || !window.contains("start") || !window.contains("end")) {
                        throw ConfigException("Blackout window requires 'start' and 'end' (HH:MM)");
                    }
                    TimeWindow tw;
                    tw.start_minute = utils::parseTimeOfDay(window.at("start").get<std::string>());
                    tw.end_minute = utils::parseTimeOfDay(window.at("end").get<std::string>());
                    session.blackout_windows.push_back(tw);
                }
            }
            // Validates ordering and windows
            SessionCalendar check(session);
            return check.config();
        }

        RetryConfig parseRetry(const json& obj, const std::string& name, RetryConfig retry) {
            readOptional(obj, "max_attempts", retry.max_attempts, name);
            readDuration(obj, "base_delay_ms", retry.base_delay, name);
            readDuration(obj, "max_delay_ms", retry.max_delay, name);
            readOptional(obj, "jitter_fraction", retry.jitter_fraction, name);
            // Constructing a policy runs its validation
            RetryPolicy check(retry);
            return check.config();
        }

        ScreeningConfig parseScreening(const json& obj) {
            ScreeningConfig screening;
            readOptional(obj, "preset", screening.preset, "screening");
            std::transform(screening.preset.begin(), screening.preset.end(), screening.preset.begin(),
                           [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            readOptional(obj, "fail_open", screening.fail_open, "screening");

            if (obj.contains("levels")) {
                const json& levels = obj.at("levels");
                if (!levels.is_array()) {
                    throw ConfigException("'screening.levels' must be an array");
                }
                for (const auto& level : levels) {
                    if (!level.is_object() || !level.contains("name") || !level.at("name").is_string()) {
                        throw ConfigException("Each screening level override requires a 'name' (string)");
                    }
                    ScreeningLevelConfig lc;
                    lc.name = level.at("name").get<std::string>();
                    if (level.contains("enabled")) {
                        bool enabled = true;
                        readOptional(level, "enabled", enabled, "screening.levels." + lc.name);
                        lc.enabled = enabled;
                    }
                    if (level.contains("fail_open")) {
                        bool fail_open = true;
                        readOptional(level, "fail_open", fail_open, "screening.levels." + lc.name);
                        lc.fail_open = fail_open;
                    }
                    if (level.contains("params")) {
                        if (!level.at("params").is_object()) {
                            throw ConfigException(fmt::format("'params' of level '{}' must be an object", lc.name));
                        }
                        lc.params = level.at("params");
                    }
                    screening.levels.push_back(std::move(lc));
                }
            }
            return screening;
        }

    } // end anonymous namespace

    const char* tradingModeToString(TradingMode mode) {
        return mode == TradingMode::Paper ? "paper" : "live";
    }

    EngineConfig parseEngineConfig(const json& root) {
        if (!root.is_object()) {
            throw ConfigException("Engine config root must be a JSON object");
        }
        EngineConfig config;

        std::string mode = "paper";
        readOptional(root, "mode", mode, "root");
        if (mode == "paper") {
            config.mode = TradingMode::Paper;
        } else if (mode == "live") {
            config.mode = TradingMode::Live;
        } else {
            throw ConfigException(fmt::format("Unknown trading mode '{}', expected 'paper' or 'live'", mode));
        }

        readOptional(root, "instruments", config.instruments, "root");

        config.session = parseSession(section(root, "session"));

        // --- Schedules ---
        const json& schedule = section(root, "schedule");
        readDuration(schedule, "monitor_interval_ms", config.schedule.monitor_interval, "schedule");
        readDuration(schedule, "aggregator_interval_ms", config.schedule.aggregator_interval, "schedule");
        readDuration(schedule, "strategy_interval_ms", config.schedule.strategy_interval, "schedule");
        readDuration(schedule, "reconciliation_interval_ms", config.schedule.reconciliation_interval, "schedule");
        readOptional(schedule, "max_consecutive_strategy_errors", config.schedule.max_consecutive_strategy_errors, "schedule");
        for (auto interval : {config.schedule.monitor_interval, config.schedule.aggregator_interval,
                              config.schedule.strategy_interval, config.schedule.reconciliation_interval}) {
            if (interval.count() == 0) {
                throw ConfigException("Loop intervals must be greater than zero");
            }
        }

        // --- Aggregator ---
        const json& aggregator = section(root, "aggregator");
        readOptional(aggregator, "tick_buffer_capacity", config.aggregator.tick_buffer_capacity, "aggregator");
        readDuration(aggregator, "bar_interval_seconds", config.aggregator.bar_interval, "aggregator");
        readOptional(aggregator, "max_bars", config.aggregator.max_bars, "aggregator");
        if (config.aggregator.tick_buffer_capacity == 0 || config.aggregator.bar_interval.count() == 0 ||
            config.aggregator.max_bars == 0) {
            throw ConfigException("Aggregator capacity, bar interval and max_bars must be positive");
        }

        // --- Router & generators ---
        const json& router = section(root, "router");
        readOptional(router, "regime_indicator", config.router.regime_indicator, "router");
        readOptional(router, "regime_threshold", config.router.regime_threshold, "router");
        readOptional(router, "min_history_bars", config.router.min_history_bars, "router");
        config.generators = section(root, "generators");

        config.screening = parseScreening(section(root, "screening"));

        // --- Retest ---
        const json& retest = section(root, "retest");
        readDuration(retest, "timeout_minutes", config.retest.timeout, "retest");
        readOptional(retest, "tolerance_pct", config.retest.tolerance_pct, "retest");
        requirePositive(config.retest.tolerance_pct, "retest.tolerance_pct");

        // --- Monitor ---
        const json& monitor = section(root, "monitor");
        readOptional(monitor, "breakeven_trigger_r", config.monitor.breakeven_trigger_r, "monitor");
        readOptional(monitor, "trail_fraction", config.monitor.trail_fraction, "monitor");
        requirePositive(config.monitor.breakeven_trigger_r, "monitor.breakeven_trigger_r");
        if (config.monitor.trail_fraction <= 0.0 || config.monitor.trail_fraction >= 1.0) {
            throw ConfigException("'monitor.trail_fraction' must be in (0, 1)");
        }

        // --- Risk ---
        const json& risk = section(root, "risk");
        readOptional(risk, "capital", config.risk.capital, "risk");
        readOptional(risk, "risk_per_trade_pct", config.risk.risk_per_trade_pct, "risk");
        readOptional(risk, "max_quantity", config.risk.max_quantity, "risk");
        readOptional(risk, "max_positions", config.risk.max_positions, "risk");
        requirePositive(config.risk.capital, "risk.capital");
        requirePositive(config.risk.risk_per_trade_pct, "risk.risk_per_trade_pct");
        if (config.risk.max_quantity < 1 || config.risk.max_positions < 1) {
            throw ConfigException("'risk.max_quantity' and 'risk.max_positions' must be at least 1");
        }

        readDuration(section(root, "reconciliation"), "grace_period_seconds",
                     config.reconciliation.grace_period, "reconciliation");

        config.order_retry = parseRetry(section(root, "order_retry"), "order_retry", config.order_retry);
        config.data_retry = parseRetry(section(root, "data_retry"), "data_retry", config.data_retry);

        // --- Feed ---
        const json& feed = section(root, "feed");
        readOptional(feed, "replay_file", config.feed.replay_file, "feed");
        readDuration(feed, "replay_tick_interval_ms", config.feed.replay_tick_interval, "feed");
        readDuration(feed, "health_check_interval_ms", config.feed.health_check_interval, "feed");
        config.feed.reconnect = parseRetry(section(feed, "reconnect"), "feed.reconnect", config.feed.reconnect);

        // --- Historical warm-up ---
        const json& historical = section(root, "historical");
        readOptional(historical, "enabled", config.historical.enabled, "historical");
        readOptional(historical, "base_url", config.historical.base_url, "historical");
        readOptional(historical, "access_token_env", config.historical.access_token_env, "historical");
        readOptional(historical, "interval", config.historical.interval, "historical");
        readOptional(historical, "lookback_days", config.historical.lookback_days, "historical");
        readDuration(historical, "timeout_ms", config.historical.timeout, "historical");

        // --- Audit ---
        const json& audit = section(root, "audit");
        readOptional(audit, "database_path", config.audit.database_path, "audit");
        readOptional(audit, "queue_capacity", config.audit.queue_capacity, "audit");
        readOptional(audit, "batch_size", config.audit.batch_size, "audit");
        readDuration(audit, "flush_interval_ms", config.audit.flush_interval, "audit");
        if (config.audit.queue_capacity == 0 || config.audit.batch_size == 0) {
            throw ConfigException("'audit.queue_capacity' and 'audit.batch_size' must be positive");
        }

        return config;
    }

    EngineConfig loadEngineConfig(const std::string& path) {
        auto logger = logging::getLogger();
        logger->info("Loading engine config from: {}", path);

        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open engine config file: {}", path));
        }
        json root;
        try {
            root = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse engine config '{}': {}", path, e.what()));
        }

        EngineConfig config = parseEngineConfig(root);
        logger->info("Engine config loaded: mode={}, {} instruments, screening preset '{}' (fail_open={})",
                     tradingModeToString(config.mode), config.instruments.size(),
                     config.screening.preset, config.screening.fail_open);
        return config;
    }

} // namespace core
