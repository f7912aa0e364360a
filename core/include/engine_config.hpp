#pragma once

#include "retry_policy.hpp"
#include "session_calendar.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace core {

    using json = nlohmann::json;

    enum class TradingMode {
        Paper,
        Live
    };

    struct ScheduleConfig {
        std::chrono::milliseconds monitor_interval{500};
        std::chrono::milliseconds aggregator_interval{1000};
        std::chrono::milliseconds strategy_interval{5000};
        std::chrono::milliseconds reconciliation_interval{60000};
        int max_consecutive_strategy_errors = 5; // Before the strategy loop starts backing off
    };

    struct AggregatorConfig {
        std::size_t tick_buffer_capacity = 5000;
        std::chrono::seconds bar_interval{60};
        std::size_t max_bars = 2000;
    };

    struct RouterConfig {
        std::string regime_indicator = "ADX(14)";
        double regime_threshold = 25.0; // Below: mean reversion, at/above: breakout
        std::size_t min_history_bars = 50;
    };

    struct ScreeningLevelConfig {
        std::string name;
        std::optional<bool> enabled;   // Overrides the preset
        std::optional<bool> fail_open; // Overrides the global policy
        json params = json::object();
    };

    struct ScreeningConfig {
        std::string preset = "medium";
        bool fail_open = true;
        std::vector<ScreeningLevelConfig> levels;
    };

    struct RetestConfig {
        std::chrono::minutes timeout{30};
        double tolerance_pct = 0.004;
    };

    struct MonitorConfig {
        double breakeven_trigger_r = 1.0;
        double trail_fraction = 0.5;
    };

    struct RiskConfig {
        double capital = 100000.0;
        double risk_per_trade_pct = 0.01;
        long long max_quantity = 100;
        int max_positions = 5;
    };

    struct ReconciliationConfig {
        std::chrono::seconds grace_period{30};
    };

    struct FeedConfig {
        std::string replay_file;   // CSV of ticks used by the paper CLI
        std::chrono::milliseconds replay_tick_interval{10};
        RetryConfig reconnect{1, std::chrono::milliseconds(2000), std::chrono::milliseconds(60000), 0.2}; // max_attempts unused, reconnects never give up
        std::chrono::milliseconds health_check_interval{1000};
    };

    struct HistoricalConfig {
        bool enabled = false;
        std::string base_url = "https://api.upstox.com";
        std::string access_token_env = "BROKER_ACCESS_TOKEN";
        std::string interval = "1minute";
        int lookback_days = 5;
        std::chrono::milliseconds timeout{15000};
    };

    struct AuditConfig {
        std::string database_path = "audit.db";
        std::size_t queue_capacity = 10000;
        std::size_t batch_size = 100;
        std::chrono::milliseconds flush_interval{1000};
    };

    struct EngineConfig {
        TradingMode mode = TradingMode::Paper;
        std::vector<std::string> instruments;
        SessionConfig session;
        ScheduleConfig schedule;
        AggregatorConfig aggregator;
        RouterConfig router;
        json generators = json::object(); // Parsed by strategy_engine::GeneratorFactory
        ScreeningConfig screening;
        RetestConfig retest;
        MonitorConfig monitor;
        RiskConfig risk;
        ReconciliationConfig reconciliation;
        RetryConfig order_retry;
        RetryConfig data_retry;
        FeedConfig feed;
        HistoricalConfig historical;
        AuditConfig audit;
    };

    // Missing keys keep their defaults; wrong types or invalid values throw ConfigException
    EngineConfig parseEngineConfig(const json& config);
    EngineConfig loadEngineConfig(const std::string& path);

    const char* tradingModeToString(TradingMode mode);

} // namespace core
