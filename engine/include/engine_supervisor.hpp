#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "clock.hpp"
#include "engine_config.hpp"
#include "session_calendar.hpp"
#include "indicators.hpp"
#include "candle_aggregator.hpp"
#include "market_feed.hpp"
#include "feed_connector.hpp"
#include "historical_data_source.hpp"
#include "async_audit_dispatcher.hpp"
#include "strategy_router.hpp"
#include "screening_pipeline.hpp"
#include "order_gateway.hpp"
#include "resilient_order_client.hpp"
#include "position_ledger.hpp"
#include "retest_wait_queue.hpp"
#include "order_worker.hpp"
#include "trade_executor.hpp"
#include "position_monitor.hpp"
#include "reconciliation_service.hpp"
#include "periodic_loop.hpp"

namespace engine {

    struct EngineSnapshot {
        bool running = false;
        core::TradingMode mode = core::TradingMode::Paper;
        core::Timestamp as_of;
        bool feed_connected = false;
        std::uint64_t feed_reconnects = 0;
        bool entries_suspended = false;
        std::size_t open_positions = 0;
        std::size_t pending_retests = 0;
        std::size_t in_flight_entries = 0;
        std::size_t closed_trades = 0;
        double realized_pnl = 0.0;
        std::uint64_t dropped_ticks = 0;
        std::uint64_t audit_dropped = 0;
        std::uint64_t audit_written = 0;
        std::optional<core::Timestamp> last_reconciliation;
        int consecutive_strategy_errors = 0;
        std::uint64_t monitor_cycles = 0;
        std::uint64_t aggregator_cycles = 0;
        std::uint64_t strategy_cycles = 0;
        std::uint64_t reconciliation_cycles = 0;

        nlohmann::json toJson() const;
    };

    // Owns every engine component, the four scheduled loops and the two order
    // workers, and sequences startup and shutdown.
    class EngineSupervisor {
    public:
        EngineSupervisor(core::EngineConfig config,
                         market_data::MarketFeed& feed,
                         execution::OrderGateway& gateway,
                         const indicators::IIndicatorLibrary& indicators,
                         audit::IAuditSink& audit_sink,
                         const core::IClock& clock,
                         data::HistoricalDataSource* historical = nullptr);
        ~EngineSupervisor();

        EngineSupervisor(const EngineSupervisor&) = delete;
        EngineSupervisor& operator=(const EngineSupervisor&) = delete;

        // Throws core::FatalStartupException when the engine cannot run
        void start();
        // Loops finish their current iteration, workers drain, audit flushes
        void stop();
        EngineSnapshot status() const;
        bool isRunning() const { return running_.load(); }

        // --- Single iterations, what the loops run ---
        void runAggregatorCycle();
        void runStrategyCycle();
        execution::MonitorCycleResult runMonitorCycle();
        execution::ReconciliationReport runReconciliationCycle();

        // Loads warm-up bars for every instrument; returns the number of instruments loaded
        std::size_t loadHistory();

        screening::MarketState buildMarketState(const std::string& instrument_key, core::Timestamp now) const;

        // --- Component access ---
        market_data::CandleAggregator& aggregator() { return *aggregator_; }
        execution::PositionLedger& ledger() { return ledger_; }
        execution::RetestWaitQueue& retests() { return *retests_; }
        execution::TradeExecutor& executor() { return *executor_; }
        screening::ScreeningPipeline& pipeline() { return *pipeline_; }
        const core::EngineConfig& config() const { return config_; }

    private:
        void strategyLoopTask();
        void onAuthenticationFailure(const std::string& reason);
        void publish(audit::AuditEventType type, nlohmann::json payload);

        core::EngineConfig config_;
        market_data::MarketFeed& feed_;
        execution::OrderGateway& gateway_;
        const indicators::IIndicatorLibrary& indicators_;
        const core::IClock& clock_;
        data::HistoricalDataSource* historical_;

        core::SessionCalendar calendar_;
        audit::AsyncAuditDispatcher audit_;
        execution::PositionLedger ledger_;

        std::unique_ptr<market_data::CandleAggregator> aggregator_;
        std::unique_ptr<market_data::FeedConnector> feed_connector_;
        std::unique_ptr<execution::RetestWaitQueue> retests_;
        std::unique_ptr<execution::ResilientOrderClient> orders_;
        std::unique_ptr<execution::OrderWorker> entry_worker_;
        std::unique_ptr<execution::OrderWorker> exit_worker_;
        std::unique_ptr<screening::ScreeningPipeline> pipeline_;
        std::unique_ptr<strategy_engine::StrategyRouter> router_;
        std::unique_ptr<execution::TradeExecutor> executor_;
        std::unique_ptr<execution::PositionMonitor> monitor_;
        std::unique_ptr<execution::ReconciliationService> reconciliation_;

        std::unique_ptr<PeriodicLoop> aggregator_loop_;
        std::unique_ptr<PeriodicLoop> monitor_loop_;
        std::unique_ptr<PeriodicLoop> strategy_loop_;
        std::unique_ptr<PeriodicLoop> reconciliation_loop_;

        std::mutex lifecycle_mutex_;
        std::atomic<bool> running_{false};
        std::atomic<int> consecutive_strategy_errors_{0};
    };

} // namespace engine
