// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <memory>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <optional>
#include <thread>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "engine_config.hpp"
#include "clock.hpp"
#include "indicator_library.hpp"
#include "replay_market_feed.hpp"
#include "paper_order_gateway.hpp"
#include "sqlite_audit_store.hpp"
#include "rest_historical_client.hpp"
#include "engine_supervisor.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

namespace {

    std::atomic<bool> g_stop_requested{false};

    void handleSignal(int) {
        g_stop_requested = true;
    }

    void printUsage(const char* program) {
        std::cout << "Usage: " << program << " [config.json] [--status-every <seconds>]" << std::endl;
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        // --- Arguments ---
        std::string config_path = "config/engine.json";
        int status_every_s = 30;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--status-every" && i + 1 < argc) {
                status_every_s = std::max(1, std::atoi(argv[++i]));
            } else {
                config_path = arg;
            }
        }

        // --- Initialize Logging ---
        core::logging::initialize("intraday_engine", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Intraday engine starting, config: {}", config_path);

        core::EngineConfig config = core::loadEngineConfig(config_path);

        if (config.mode == core::TradingMode::Live) {
            // Only the simulated venue ships with this executable
            throw core::FatalStartupException("Live mode needs a broker order gateway; this build only provides paper trading.");
        }
        if (config.feed.replay_file.empty()) {
            throw core::FatalStartupException("feed.replay_file is required in paper mode.");
        }

        // --- Audit Store ---
        data::SqliteAuditStore audit_store(config.audit.database_path);
        if (!audit_store.connect() || !audit_store.initializeSchema()) {
            throw core::FatalStartupException("Cannot open audit database: " + config.audit.database_path);
        }

        // --- Collaborators ---
        core::SystemClock clock;
        indicators::TaLibIndicatorLibrary indicator_library;
        market_data::ReplayMarketFeed feed(config.feed.replay_file, config.feed.replay_tick_interval);

        engine::EngineSupervisor* supervisor_ptr = nullptr;
        execution::PaperOrderGateway gateway([&supervisor_ptr](const std::string& key) -> std::optional<double> {
            if (supervisor_ptr == nullptr) return std::nullopt;
            return supervisor_ptr->aggregator().latestPrice(key);
        });

        std::unique_ptr<data::RestHistoricalClient> historical;
        if (config.historical.enabled) {
            const char* token_env = std::getenv(config.historical.access_token_env.c_str());
            std::string token = token_env ? token_env : "";
            if (token.empty()) {
                logger->warn("Historical warm-up enabled but {} is not set; warm-up requests will be rejected.",
                             config.historical.access_token_env);
            }
            historical = std::make_unique<data::RestHistoricalClient>(config.historical.base_url, token,
                                                                      config.historical.timeout);
        }

        engine::EngineSupervisor supervisor(config, feed, gateway, indicator_library, audit_store, clock, historical.get());
        supervisor_ptr = &supervisor;

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        supervisor.start();

        // --- Run until interrupted or the replay is exhausted ---
        auto next_status = std::chrono::steady_clock::now() + std::chrono::seconds(status_every_s);
        while (!g_stop_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            if (std::chrono::steady_clock::now() >= next_status) {
                logger->info("Status: {}", supervisor.status().toJson().dump());
                next_status += std::chrono::seconds(status_every_s);
            }
            if (feed.finished()) {
                logger->info("Replay finished ({} ticks).", feed.loadedTickCount());
                // Let the monitor act on the final prices before shutting down
                std::this_thread::sleep_for(config.schedule.aggregator_interval + config.schedule.monitor_interval);
                break;
            }
        }

        supervisor.stop();
        supervisor_ptr = nullptr;
        logger->info("Final status: {}", supervisor.status().toJson().dump(2));
        logger->info("Audit events stored: {}", audit_store.countEvents());
        audit_store.disconnect();

        logger->info("Intraday engine finished.");

    // --- Exception Handling ---
    } catch (const core::EngineException& ex) {
        std::cerr << "Engine Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Engine Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
