#include <gtest/gtest.h>
#include "engine_config.hpp"
#include "exceptions.hpp"
#include <cstdio>
#include <fstream>

using namespace core;

TEST(EngineConfigTest, EmptyObjectKeepsDefaults) {
    EngineConfig config = parseEngineConfig(json::object());
    EXPECT_EQ(config.mode, TradingMode::Paper);
    EXPECT_EQ(config.schedule.monitor_interval.count(), 500);
    EXPECT_EQ(config.schedule.strategy_interval.count(), 5000);
    EXPECT_EQ(config.retest.timeout.count(), 30);
    EXPECT_DOUBLE_EQ(config.router.regime_threshold, 25.0);
    EXPECT_EQ(config.screening.preset, "medium");
    EXPECT_TRUE(config.screening.fail_open);
    EXPECT_EQ(config.session.market_open_minute, 555);
}

TEST(EngineConfigTest, ParsesSectionsAndOverrides) {
    json root = json::parse(R"({
        "mode": "live",
        "instruments": ["NSE_EQ|A", "NSE_EQ|B"],
        "session": { "market_open": "09:30", "flatten_time": "15:00",
                     "blackout_windows": [ { "start": "12:00", "end": "12:30" } ] },
        "schedule": { "monitor_interval_ms": 250, "max_consecutive_strategy_errors": 3 },
        "router": { "regime_threshold": 30 },
        "screening": { "preset": "STRICT", "fail_open": false,
                       "levels": [ { "name": "heuristic_score", "enabled": true, "fail_open": true,
                                     "params": { "min_score": 70 } } ] },
        "retest": { "timeout_minutes": 15, "tolerance_pct": 0.002 },
        "risk": { "max_positions": 3 },
        "order_retry": { "max_attempts": 5, "base_delay_ms": 100, "max_delay_ms": 800 },
        "generators": { "breakout": { "channel_lookback": 30 } }
    })");
    EngineConfig config = parseEngineConfig(root);

    EXPECT_EQ(config.mode, TradingMode::Live);
    ASSERT_EQ(config.instruments.size(), 2u);
    EXPECT_EQ(config.session.market_open_minute, 9 * 60 + 30);
    EXPECT_EQ(config.session.flatten_minute, 15 * 60);
    ASSERT_EQ(config.session.blackout_windows.size(), 1u);
    EXPECT_EQ(config.session.blackout_windows[0].start_minute, 720);
    EXPECT_EQ(config.schedule.monitor_interval.count(), 250);
    EXPECT_EQ(config.schedule.max_consecutive_strategy_errors, 3);
    EXPECT_DOUBLE_EQ(config.router.regime_threshold, 30.0);
    EXPECT_EQ(config.screening.preset, "strict");
    EXPECT_FALSE(config.screening.fail_open);
    ASSERT_EQ(config.screening.levels.size(), 1u);
    EXPECT_EQ(config.screening.levels[0].name, "heuristic_score");
    EXPECT_TRUE(config.screening.levels[0].fail_open.value());
    EXPECT_EQ(config.screening.levels[0].params.at("min_score").get<int>(), 70);
    EXPECT_EQ(config.retest.timeout.count(), 15);
    EXPECT_EQ(config.risk.max_positions, 3);
    EXPECT_EQ(config.order_retry.max_attempts, 5);
    EXPECT_EQ(config.order_retry.max_delay.count(), 800);
    EXPECT_EQ(config.generators.at("breakout").at("channel_lookback").get<int>(), 30);
}

TEST(EngineConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(parseEngineConfig(json::parse(R"({"mode": "margin"})")), ConfigException);
    EXPECT_THROW(parseEngineConfig(json::parse(R"({"instruments": "NSE_EQ|A"})")), ConfigException);
    EXPECT_THROW(parseEngineConfig(json::parse(R"({"session": {"market_open": "16:00"}})")), ConfigException);
    EXPECT_THROW(parseEngineConfig(json::parse(R"({"schedule": {"monitor_interval_ms": -5}})")), ConfigException);
    EXPECT_THROW(parseEngineConfig(json::parse(R"({"monitor": {"trail_fraction": 1.5}})")), ConfigException);
    EXPECT_THROW(parseEngineConfig(json::parse(R"({"risk": {"max_positions": 0}})")), ConfigException);
    EXPECT_THROW(parseEngineConfig(json::parse(R"({"screening": {"levels": [{"enabled": true}]}})")), ConfigException);
    EXPECT_THROW(parseEngineConfig(json::parse(R"({"order_retry": {"max_attempts": 0}})")), ConfigException);
    EXPECT_THROW(parseEngineConfig(json::parse("[]")), ConfigException);
}

TEST(EngineConfigTest, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "engine_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"instruments": ["NSE_EQ|A"], "audit": {"database_path": ":memory:"}})";
    }
    EngineConfig config = loadEngineConfig(path);
    EXPECT_EQ(config.instruments.size(), 1u);
    EXPECT_EQ(config.audit.database_path, ":memory:");
    std::remove(path.c_str());
}

TEST(EngineConfigTest, MissingOrBrokenFileIsConfigError) {
    EXPECT_THROW(loadEngineConfig("/nonexistent/engine.json"), ConfigException);

    std::string path = ::testing::TempDir() + "engine_config_broken.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(loadEngineConfig(path), ConfigException);
    std::remove(path.c_str());
}
