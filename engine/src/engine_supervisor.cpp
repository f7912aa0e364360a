#include "engine_supervisor.hpp"
#include "generator_factory.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace engine {

nlohmann::json EngineSnapshot::toJson() const {
    nlohmann::json j = {
        {"running", running},
        {"mode", core::tradingModeToString(mode)},
        {"as_of", core::utils::timestampToString(as_of)},
        {"feed_connected", feed_connected},
        {"feed_reconnects", feed_reconnects},
        {"entries_suspended", entries_suspended},
        {"open_positions", open_positions},
        {"pending_retests", pending_retests},
        {"in_flight_entries", in_flight_entries},
        {"closed_trades", closed_trades},
        {"realized_pnl", realized_pnl},
        {"dropped_ticks", dropped_ticks},
        {"audit_dropped", audit_dropped},
        {"audit_written", audit_written},
        {"consecutive_strategy_errors", consecutive_strategy_errors},
        {"cycles", {
            {"monitor", monitor_cycles},
            {"aggregator", aggregator_cycles},
            {"strategy", strategy_cycles},
            {"reconciliation", reconciliation_cycles}
        }}
    };
    j["last_reconciliation"] = last_reconciliation ? nlohmann::json(core::utils::timestampToString(*last_reconciliation))
                                                   : nlohmann::json(nullptr);
    return j;
}

EngineSupervisor::EngineSupervisor(core::EngineConfig config,
                                   market_data::MarketFeed& feed,
                                   execution::OrderGateway& gateway,
                                   const indicators::IIndicatorLibrary& indicators,
                                   audit::IAuditSink& audit_sink,
                                   const core::IClock& clock,
                                   data::HistoricalDataSource* historical)
    : config_(std::move(config)),
      feed_(feed),
      gateway_(gateway),
      indicators_(indicators),
      clock_(clock),
      historical_(historical),
      calendar_(config_.session),
      audit_(audit_sink, config_.audit.queue_capacity, config_.audit.batch_size, config_.audit.flush_interval)
{
    auto logger = core::logging::getLogger();
    aggregator_ = std::make_unique<market_data::CandleAggregator>(
        config_.aggregator.tick_buffer_capacity, config_.aggregator.bar_interval, config_.aggregator.max_bars);
    feed_connector_ = std::make_unique<market_data::FeedConnector>(
        feed_, core::RetryPolicy(config_.feed.reconnect), config_.feed.health_check_interval);
    retests_ = std::make_unique<execution::RetestWaitQueue>(config_.retest.timeout, config_.retest.tolerance_pct);
    orders_ = std::make_unique<execution::ResilientOrderClient>(
        gateway_, core::RetryPolicy(config_.order_retry),
        [this](const std::string& reason) { onAuthenticationFailure(reason); });
    entry_worker_ = std::make_unique<execution::OrderWorker>("entry");
    exit_worker_ = std::make_unique<execution::OrderWorker>("exit");

    pipeline_ = screening::buildPipeline(config_.screening, config_.risk, indicators_, &audit_);

    auto generators = strategy_engine::GeneratorFactory::createGenerators(config_.generators, indicators_);
    router_ = std::make_unique<strategy_engine::StrategyRouter>(config_.router, indicators_, calendar_,
                                                                std::move(generators.mean_reversion),
                                                                std::move(generators.breakout));

    executor_ = std::make_unique<execution::TradeExecutor>(config_.risk, *pipeline_, ledger_, *retests_, *orders_,
                                                           *entry_worker_, &audit_);
    monitor_ = std::make_unique<execution::PositionMonitor>(config_.monitor, ledger_, *executor_, *orders_,
                                                            *exit_worker_, calendar_, &audit_);
    reconciliation_ = std::make_unique<execution::ReconciliationService>(config_.reconciliation, ledger_, *orders_, &audit_);

    // --- Loops ---
    aggregator_loop_ = std::make_unique<PeriodicLoop>("aggregator", config_.schedule.aggregator_interval,
                                                      [this]() { runAggregatorCycle(); });
    monitor_loop_ = std::make_unique<PeriodicLoop>("monitor", config_.schedule.monitor_interval,
                                                   [this]() { runMonitorCycle(); });
    strategy_loop_ = std::make_unique<PeriodicLoop>("strategy", config_.schedule.strategy_interval,
                                                    [this]() { strategyLoopTask(); });
    reconciliation_loop_ = std::make_unique<PeriodicLoop>("reconciliation", config_.schedule.reconciliation_interval,
                                                          [this]() { runReconciliationCycle(); });

    logger->info("EngineSupervisor ready: {} mode, {} instruments.", core::tradingModeToString(config_.mode),
                 config_.instruments.size());
}

EngineSupervisor::~EngineSupervisor() {
    stop();
}

// --- Lifecycle ---

void EngineSupervisor::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) {
        core::logging::getLogger()->warn("Engine already running.");
        return;
    }
    auto logger = core::logging::getLogger();
    if (config_.instruments.empty()) {
        throw core::FatalStartupException("No instruments configured, nothing to trade.");
    }
    logger->info("--- Engine starting ({} mode) ---", core::tradingModeToString(config_.mode));

    audit_.start();
    entry_worker_->start();
    exit_worker_->start();

    if (config_.historical.enabled) {
        loadHistory();
    }

    feed_.setTickHandler([this](const core::Tick& tick) { aggregator_->ingest(tick); });
    feed_connector_->setSubscriptions(config_.instruments);
    if (!feed_connector_->connectOnce()) {
        logger->warn("Initial feed connect failed; the connector keeps retrying in the background.");
    }
    feed_connector_->start();

    aggregator_loop_->start();
    monitor_loop_->start();
    strategy_loop_->start();
    reconciliation_loop_->start();

    running_ = true;
    publish(audit::AuditEventType::EngineStarted,
            {{"mode", core::tradingModeToString(config_.mode)}, {"instruments", config_.instruments}});
    logger->info("--- Engine running ---");
}

void EngineSupervisor::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.exchange(false)) return;
    auto logger = core::logging::getLogger();
    logger->info("--- Engine stopping ---");

    // No new decisions first, then the data path, then the protective loop
    strategy_loop_->stop();
    reconciliation_loop_->stop();
    feed_connector_->stop();
    aggregator_loop_->stop();
    monitor_loop_->stop();

    // Orders already handed over are completed
    entry_worker_->stop();
    exit_worker_->stop();

    auto open = ledger_.getAll();
    if (!open.empty()) {
        logger->warn("Engine stopped with {} open position(s); they remain at the venue.", open.size());
    }
    publish(audit::AuditEventType::EngineStopped,
            {{"open_positions", open.size()}, {"realized_pnl", ledger_.realizedPnl()}});
    audit_.stop();
    logger->info("--- Engine stopped ---");
}

EngineSnapshot EngineSupervisor::status() const {
    EngineSnapshot s;
    s.running = running_.load();
    s.mode = config_.mode;
    s.as_of = clock_.now();
    s.feed_connected = feed_connector_->isConnected();
    s.feed_reconnects = feed_connector_->reconnectCount();
    s.entries_suspended = executor_->entriesSuspended();
    s.open_positions = ledger_.size();
    s.pending_retests = retests_->size();
    s.in_flight_entries = executor_->inFlightCount();
    s.closed_trades = ledger_.tradeLog().size();
    s.realized_pnl = ledger_.realizedPnl();
    s.dropped_ticks = aggregator_->droppedTickCount();
    s.audit_dropped = audit_.droppedCount();
    s.audit_written = audit_.writtenCount();
    s.last_reconciliation = reconciliation_->lastCompleted();
    s.consecutive_strategy_errors = consecutive_strategy_errors_.load();
    s.monitor_cycles = monitor_loop_->cycleCount();
    s.aggregator_cycles = aggregator_loop_->cycleCount();
    s.strategy_cycles = strategy_loop_->cycleCount();
    s.reconciliation_cycles = reconciliation_loop_->cycleCount();
    return s;
}

// --- Cycles ---

void EngineSupervisor::runAggregatorCycle() {
    aggregator_->rebuild();
}

execution::MonitorCycleResult EngineSupervisor::runMonitorCycle() {
    return monitor_->runCycle(aggregator_->latestPrices(), clock_.now());
}

execution::ReconciliationReport EngineSupervisor::runReconciliationCycle() {
    return reconciliation_->runOnce(clock_.now());
}

void EngineSupervisor::runStrategyCycle() {
    auto logger = core::logging::getLogger();
    core::Timestamp now = clock_.now();

    if (executor_->entriesSuspended()) {
        logger->debug("Strategy cycle skipped: entries suspended.");
        return;
    }

    int open = static_cast<int>(ledger_.size());
    if (open >= config_.risk.max_positions) {
        logger->debug("Strategy cycle skipped: {} of {} position slots used.", open, config_.risk.max_positions);
        return;
    }

    auto result = router_->runCycle(config_.instruments, *aggregator_, now,
                                    [this](const std::string& key) { return executor_->isOccupied(key); });
    if (result.blackout || result.signals.empty()) {
        return;
    }

    std::size_t slots = static_cast<std::size_t>(config_.risk.max_positions - open);
    auto signals = strategy_engine::StrategyRouter::rankSignals(std::move(result.signals), slots);
    for (const auto& signal : signals) {
        auto outcome = executor_->submitSignal(signal, buildMarketState(signal.instrument_key, now), now);
        logger->info("Signal {} {} -> {}", signal.instrument_key, core::directionToString(signal.direction),
                     execution::entryOutcomeToString(outcome));
    }
}

void EngineSupervisor::strategyLoopTask() {
    try {
        runStrategyCycle();
        if (consecutive_strategy_errors_.exchange(0) > 0) {
            core::logging::getLogger()->info("Strategy loop recovered.");
        }
    } catch (const std::exception& e) {
        int failures = ++consecutive_strategy_errors_;
        auto logger = core::logging::getLogger();
        logger->error("Strategy cycle failed ({} in a row): {}", failures, e.what());
        int threshold = config_.schedule.max_consecutive_strategy_errors;
        if (failures >= threshold) {
            // 1s, 2s, 4s ... capped at 30s
            int exponent = std::min(failures - threshold, 5);
            auto backoff = std::min(std::chrono::milliseconds(30000), std::chrono::milliseconds(1000 << exponent));
            logger->warn("Strategy loop backing off {} ms.", backoff.count());
            strategy_loop_->delayNext(backoff);
        }
    }
}

std::size_t EngineSupervisor::loadHistory() {
    auto logger = core::logging::getLogger();
    if (historical_ == nullptr) {
        logger->warn("Historical warm-up enabled but no historical source configured.");
        return 0;
    }

    core::Timestamp now = clock_.now();
    std::string to_date = core::utils::exchangeDate(now);
    std::string from_date = core::utils::exchangeDate(now - std::chrono::hours(24 * config_.historical.lookback_days));
    core::RetryPolicy policy(config_.data_retry);

    std::size_t loaded = 0;
    for (const auto& instrument : config_.instruments) {
        try {
            auto bars = policy.execute(fmt::format("fetchCandles {}", instrument), [&]() {
                return historical_->fetchCandles(instrument, config_.historical.interval, from_date, to_date);
            });
            aggregator_->mergeHistorical(instrument, bars);
            ++loaded;
        } catch (const core::TransientException& e) {
            logger->warn("Warm-up for {} failed, starting from live ticks only: {}", instrument, e.what());
        } catch (const core::DataException& e) {
            logger->warn("Warm-up data for {} unusable: {}", instrument, e.what());
        } catch (const core::ApiRequestException& e) {
            logger->warn("Warm-up request for {} rejected: {}", instrument, e.what());
        } catch (const core::AuthenticationException& e) {
            logger->error("Historical source rejected credentials, skipping warm-up: {}", e.what());
            break;
        }
    }
    logger->info("Historical warm-up: {} of {} instruments loaded ({} -> {}).", loaded, config_.instruments.size(),
                 from_date, to_date);
    return loaded;
}

screening::MarketState EngineSupervisor::buildMarketState(const std::string& instrument_key, core::Timestamp now) const {
    screening::MarketState state;
    state.now = now;
    state.bars = aggregator_->snapshot(instrument_key);
    state.last_price = aggregator_->latestPrice(instrument_key);

    // Breadth: each watched instrument vs. its session open
    for (const auto& key : config_.instruments) {
        auto open = aggregator_->sessionOpenPrice(key);
        auto last = aggregator_->latestPrice(key);
        if (!open || !last) continue;
        if (*last > *open) ++state.advancing;
        else if (*last < *open) ++state.declining;
        else ++state.unchanged;
    }
    return state;
}

void EngineSupervisor::onAuthenticationFailure(const std::string& reason) {
    executor_->suspendEntries(fmt::format("authentication failure: {}", reason), clock_.now());
}

void EngineSupervisor::publish(audit::AuditEventType type, nlohmann::json payload) {
    audit::AuditEvent event;
    event.timestamp = clock_.now();
    event.type = type;
    event.payload = std::move(payload);
    audit_.publish(std::move(event));
}

} // namespace engine
