#include "trade_executor.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace execution {

const char* entryOutcomeToString(EntryOutcome outcome) {
    switch (outcome) {
        case EntryOutcome::Placed: return "PLACED";
        case EntryOutcome::Queued: return "QUEUED";
        case EntryOutcome::Occupied: return "OCCUPIED";
        case EntryOutcome::Blocked: return "BLOCKED";
        case EntryOutcome::Suspended: return "SUSPENDED";
        case EntryOutcome::SizingRejected: return "SIZING_REJECTED";
        case EntryOutcome::OrderFailed: return "ORDER_FAILED";
    }
    return "UNKNOWN";
}

TradeExecutor::TradeExecutor(core::RiskConfig risk,
                             screening::ScreeningPipeline& pipeline,
                             PositionLedger& ledger,
                             RetestWaitQueue& retests,
                             ResilientOrderClient& orders,
                             OrderWorker& entry_worker,
                             audit::IAuditPublisher* publisher)
    : risk_(risk),
      pipeline_(pipeline),
      ledger_(ledger),
      retests_(retests),
      orders_(orders),
      entry_worker_(entry_worker),
      publisher_(publisher) {}

// --- Claims ---

bool TradeExecutor::isOccupied(const std::string& instrument_key) const {
    std::lock_guard<std::mutex> lock(entry_mutex_);
    return in_flight_.count(instrument_key) > 0 || ledger_.has(instrument_key) || retests_.has(instrument_key);
}

bool TradeExecutor::claim(const std::string& instrument_key) {
    std::lock_guard<std::mutex> lock(entry_mutex_);
    if (in_flight_.count(instrument_key) > 0 || ledger_.has(instrument_key) || retests_.has(instrument_key)) {
        return false;
    }
    in_flight_.insert(instrument_key);
    return true;
}

void TradeExecutor::release(const std::string& instrument_key) {
    std::lock_guard<std::mutex> lock(entry_mutex_);
    in_flight_.erase(instrument_key);
}

std::size_t TradeExecutor::inFlightCount() const {
    std::lock_guard<std::mutex> lock(entry_mutex_);
    return in_flight_.size();
}

long long TradeExecutor::positionSize(double entry_price, double stop_loss) const {
    double risk_per_unit = std::abs(entry_price - stop_loss);
    if (risk_per_unit <= 0.0 || !std::isfinite(risk_per_unit)) {
        return 0;
    }
    double risk_budget = risk_.capital * risk_.risk_per_trade_pct;
    long long quantity = static_cast<long long>(std::floor(risk_budget / risk_per_unit));
    return std::clamp<long long>(quantity, 1, risk_.max_quantity);
}

// --- Suspension ---

void TradeExecutor::suspendEntries(const std::string& reason, core::Timestamp now) {
    if (entries_suspended_.exchange(true)) return;
    core::logging::getLogger()->critical("NEW ENTRIES SUSPENDED: {}. Exits continue.", reason);
    publish(audit::AuditEventType::EntriesSuspended, "", {{"reason", reason}}, now);
}

void TradeExecutor::resumeEntries() {
    if (entries_suspended_.exchange(false)) {
        core::logging::getLogger()->warn("New entries resumed.");
    }
}

// --- Entries ---

EntryOutcome TradeExecutor::submitSignal(const core::Signal& signal, const screening::MarketState& state, core::Timestamp now) {
    auto logger = core::logging::getLogger();
    if (entries_suspended_.load()) {
        logger->warn("Signal for {} ignored: entries suspended.", signal.instrument_key);
        return EntryOutcome::Suspended;
    }
    if (!claim(signal.instrument_key)) {
        logger->debug("Signal for {} rejected before screening: instrument occupied.", signal.instrument_key);
        return EntryOutcome::Occupied;
    }

    core::ScreeningVerdict verdict = pipeline_.validate(signal, state, ledger_.getAll());
    if (!verdict.passed) {
        release(signal.instrument_key);
        return EntryOutcome::Blocked;
    }

    long long quantity = positionSize(signal.entry_price, signal.stop_loss);
    if (quantity <= 0) {
        logger->warn("Signal for {} has no risk distance (entry {:.2f}, stop {:.2f}), not sized.",
                     signal.instrument_key, signal.entry_price, signal.stop_loss);
        release(signal.instrument_key);
        return EntryOutcome::SizingRejected;
    }

    if (signal.requires_retest) {
        bool queued = false;
        {
            // Hand-over from claim to queue must not let a concurrent fill's claim be erased
            std::lock_guard<std::mutex> lock(entry_mutex_);
            queued = retests_.enqueue(signal, quantity, now);
            in_flight_.erase(signal.instrument_key);
        }
        if (!queued) {
            return EntryOutcome::Occupied;
        }
        auto payload = audit::signalToJson(signal);
        payload["quantity"] = quantity;
        publish(audit::AuditEventType::RetestQueued, signal.instrument_key, payload, now);
        return EntryOutcome::Queued;
    }

    return placeEntry(signal.instrument_key, signal.direction, quantity, signal.entry_price,
                      signal.stop_loss, signal.target, signal.strategy_id, now);
}

RetestEvaluation TradeExecutor::evaluateRetests(const std::map<std::string, double>& prices, core::Timestamp now) {
    RetestEvaluation evaluation;
    {
        // Resolution and claim are one step so the instrument never looks free in between
        std::lock_guard<std::mutex> lock(entry_mutex_);
        evaluation = retests_.evaluate(prices, now);
        for (const auto& fill : evaluation.filled) {
            in_flight_.insert(fill.retest.instrument_key);
        }
    }

    for (const auto& retest : evaluation.expired) {
        publish(audit::AuditEventType::RetestExpired, retest.instrument_key,
                {{"level", retest.breakout_price}, {"deadline", core::utils::timestampToString(retest.deadline)}}, now);
    }
    for (const auto& retest : evaluation.invalidated) {
        publish(audit::AuditEventType::RetestInvalidated, retest.instrument_key,
                {{"level", retest.breakout_price}, {"stop_loss", retest.stop_loss}}, now);
    }
    for (const auto& fill : evaluation.filled) {
        publish(audit::AuditEventType::RetestFilled, fill.retest.instrument_key,
                {{"level", fill.retest.breakout_price}, {"price", fill.price}, {"quantity", fill.retest.quantity}}, now);
        bool posted = entry_worker_.post([this, fill, now]() { fillRetest(fill, now); });
        if (!posted) {
            core::logging::getLogger()->warn("Retest fill for {} dropped: entry worker stopped.", fill.retest.instrument_key);
            release(fill.retest.instrument_key);
        }
    }
    return evaluation;
}

std::size_t TradeExecutor::cancelPendingRetests(const std::string& reason, core::Timestamp now) {
    std::vector<core::PendingRetest> dropped;
    {
        std::lock_guard<std::mutex> lock(entry_mutex_);
        dropped = retests_.clear();
    }
    for (const auto& retest : dropped) {
        core::logging::getLogger()->info("Retest for {} cancelled: {}", retest.instrument_key, reason);
        publish(audit::AuditEventType::RetestExpired, retest.instrument_key,
                {{"level", retest.breakout_price}, {"reason", reason}}, now);
    }
    return dropped.size();
}

EntryOutcome TradeExecutor::fillRetest(const RetestFill& fill, core::Timestamp now) {
    auto logger = core::logging::getLogger();
    const core::PendingRetest& retest = fill.retest;
    if (entries_suspended_.load()) {
        logger->warn("Retest fill for {} skipped: entries suspended.", retest.instrument_key);
        release(retest.instrument_key);
        return EntryOutcome::Suspended;
    }
    if (static_cast<int>(ledger_.size()) >= risk_.max_positions) {
        logger->warn("Retest fill for {} skipped: {} positions already open.", retest.instrument_key, ledger_.size());
        release(retest.instrument_key);
        return EntryOutcome::SizingRejected;
    }
    return placeEntry(retest.instrument_key, retest.direction, retest.quantity, fill.price,
                      retest.stop_loss, retest.target, retest.strategy_id, now);
}

EntryOutcome TradeExecutor::placeEntry(const std::string& instrument_key, core::Direction direction, long long quantity,
                                       double reference_price, double stop_loss, double target,
                                       const std::string& strategy_id, core::Timestamp now)
{
    OrderRequest request;
    request.instrument_key = instrument_key;
    request.side = entrySide(direction);
    request.quantity = quantity;
    request.reference_price = reference_price;
    request.tag = "ENTRY";
    request.client_order_id = orders_.nextClientOrderId(request.tag, instrument_key);

    // No lock is held across the network call; the claim keeps the instrument reserved
    OrderResult result = orders_.placeOrder(request);
    if (!result.ok()) {
        publish(audit::AuditEventType::OrderFailed, instrument_key,
                {{"client_order_id", request.client_order_id}, {"side", orderSideToString(request.side)},
                 {"quantity", quantity}, {"error", orderErrorKindToString(result.error->kind)},
                 {"message", result.error->message}}, now);
        release(instrument_key);
        return EntryOutcome::OrderFailed;
    }

    core::Position position;
    position.instrument_key = instrument_key;
    position.direction = direction;
    position.entry_price = result.fill_price;
    position.quantity = result.filled_quantity > 0 ? result.filled_quantity : quantity;
    position.stop_loss = stop_loss;
    position.initial_stop_loss = stop_loss;
    position.target = target;
    position.peak_favorable_price = result.fill_price;
    position.order_id = result.order_id;
    position.strategy_id = strategy_id;
    position.opened_at = now;

    publish(audit::AuditEventType::OrderPlaced, instrument_key,
            {{"client_order_id", request.client_order_id}, {"order_id", result.order_id},
             {"side", orderSideToString(request.side)}, {"quantity", position.quantity},
             {"fill_price", result.fill_price}}, now);

    bool added = ledger_.add(position);
    release(instrument_key);
    if (!added) {
        core::logging::getLogger()->error("Entry filled for {} but the ledger refused it; reconciliation will report the venue position.",
                                          instrument_key);
        return EntryOutcome::OrderFailed;
    }
    publish(audit::AuditEventType::PositionOpened, instrument_key, audit::positionToJson(position), now);
    return EntryOutcome::Placed;
}

void TradeExecutor::publish(audit::AuditEventType type, const std::string& instrument_key, nlohmann::json payload,
                            core::Timestamp now)
{
    if (publisher_ == nullptr) return;
    audit::AuditEvent event;
    event.timestamp = now;
    event.type = type;
    event.instrument_key = instrument_key;
    event.payload = std::move(payload);
    publisher_->publish(std::move(event));
}

} // namespace execution
