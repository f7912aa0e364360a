#include "position_monitor.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <exception>

namespace execution {

PositionMonitor::PositionMonitor(core::MonitorConfig config,
                                 PositionLedger& ledger,
                                 TradeExecutor& executor,
                                 ResilientOrderClient& orders,
                                 OrderWorker& exit_worker,
                                 const core::SessionCalendar& calendar,
                                 audit::IAuditPublisher* publisher)
    : config_(config),
      ledger_(ledger),
      executor_(executor),
      orders_(orders),
      exit_worker_(exit_worker),
      calendar_(calendar),
      publisher_(publisher)
{
    if (config_.breakeven_trigger_r <= 0.0 || config_.trail_fraction <= 0.0 || config_.trail_fraction >= 1.0) {
        throw core::ConfigException("Monitor needs breakeven_trigger_r > 0 and 0 < trail_fraction < 1.");
    }
}

double PositionMonitor::ratchetStop(const core::Position& position, bool breakeven_this_cycle) const {
    if (!position.breakeven_moved || breakeven_this_cycle) {
        return position.stop_loss;
    }
    // Lock in a fraction of the best excursion
    double candidate = position.entry_price + config_.trail_fraction * (position.peak_favorable_price - position.entry_price);
    bool tighter = position.isLong() ? candidate > position.stop_loss : candidate < position.stop_loss;
    return tighter ? candidate : position.stop_loss;
}

std::optional<core::ExitReason> PositionMonitor::checkExit(const core::Position& position, double price) const {
    if (position.isLong()) {
        if (price <= position.stop_loss) return core::ExitReason::StopLoss;
        if (price >= position.target) return core::ExitReason::Target;
    } else {
        if (price >= position.stop_loss) return core::ExitReason::StopLoss;
        if (price <= position.target) return core::ExitReason::Target;
    }
    return std::nullopt;
}

MonitorCycleResult PositionMonitor::runCycle(const std::map<std::string, double>& prices, core::Timestamp now) {
    auto logger = core::logging::getLogger();
    MonitorCycleResult result;

    // --- Session flatten: announced and retests cancelled once per session date ---
    bool in_flatten = calendar_.isFlattenWindow(now);
    if (in_flatten) {
        std::string session = calendar_.sessionDate(now);
        if (flattened_session_ != session) {
            flattened_session_ = session;
            logger->warn("Session flatten for {}: closing {} open position(s).", session, ledger_.size());
            executor_.cancelPendingRetests("session flatten", now);
        }
    }

    for (const auto& snapshot : ledger_.getAll()) {
        const std::string& key = snapshot.instrument_key;
        auto price_it = prices.find(key);
        if (price_it == prices.end()) {
            logger->trace("Monitor: no price for {}", key);
            continue;
        }
        if (snapshot.exit_pending) {
            continue;
        }
        double price = price_it->second;
        ++result.positions_checked;

        // 1. Peak
        ledger_.updatePeak(key, price);

        // 2. Breakeven
        auto position = ledger_.get(key);
        if (!position) continue;
        bool breakeven_this_cycle = false;
        double excursion = position->isLong() ? position->peak_favorable_price - position->entry_price
                                              : position->entry_price - position->peak_favorable_price;
        if (!position->breakeven_moved && position->initialRisk() > 0.0 &&
            excursion >= config_.breakeven_trigger_r * position->initialRisk()) {
            double old_stop = position->stop_loss;
            if (ledger_.moveToBreakeven(key)) {
                breakeven_this_cycle = true;
                position = ledger_.get(key);
                if (!position) continue;
                logger->info("Breakeven: {} stop {:.2f} -> {:.2f} (excursion {:.2f} >= {:.1f}R)", key, old_stop,
                             position->stop_loss, excursion, config_.breakeven_trigger_r);
                publish(audit::AuditEventType::StopAdjusted, key,
                        {{"kind", "BREAKEVEN"}, {"old_stop", old_stop}, {"new_stop", position->stop_loss}}, now);
                ++result.stops_adjusted;
            }
        }

        // 3. Trailing
        double new_stop = ratchetStop(*position, breakeven_this_cycle);
        if (new_stop != position->stop_loss && ledger_.updateStop(key, new_stop)) {
            logger->info("Trailing: {} stop {:.2f} -> {:.2f} (peak {:.2f})", key, position->stop_loss, new_stop,
                         position->peak_favorable_price);
            publish(audit::AuditEventType::StopAdjusted, key,
                    {{"kind", "TRAILING"}, {"old_stop", position->stop_loss}, {"new_stop", new_stop},
                     {"peak", position->peak_favorable_price}}, now);
            position->stop_loss = new_stop;
            ++result.stops_adjusted;
        }

        // 4. Exits
        std::optional<core::ExitReason> reason = checkExit(*position, price);
        // Everything still open in the flatten window is closed
        if (!reason && in_flatten) {
            reason = core::ExitReason::SessionFlatten;
        }
        if (reason && submitExit(*position, price, *reason, now)) {
            ++result.exits_triggered;
        }
    }

    // --- Retests ---
    if (!in_flatten) {
        RetestEvaluation retests = executor_.evaluateRetests(prices, now);
        result.retests_filled = static_cast<int>(retests.filled.size());
        result.retests_expired = static_cast<int>(retests.expired.size() + retests.invalidated.size());
    }
    return result;
}

bool PositionMonitor::submitExit(const core::Position& position, double price, core::ExitReason reason, core::Timestamp now) {
    auto logger = core::logging::getLogger();
    const std::string& key = position.instrument_key;
    std::string tag = fmt::format("EXIT_{}", core::exitReasonToString(reason));

    // An exit the venue may already hold goes out again under its first id
    std::string client_order_id = position.exit_client_order_id.empty()
        ? orders_.nextClientOrderId(tag, key)
        : position.exit_client_order_id;
    if (!ledger_.markExitPending(key, reason, client_order_id)) {
        return false;
    }
    logger->info("Exit triggered: {} {} @ {:.2f} ({}), SL {:.2f} TGT {:.2f}", key,
                 core::directionToString(position.direction), price, core::exitReasonToString(reason),
                 position.stop_loss, position.target);

    bool posted = exit_worker_.post([this, key, price, reason, now]() {
        try {
            executeExit(key, price, reason, now);
        } catch (const std::exception& e) {
            core::logging::getLogger()->error("Exit for {} aborted: {}. Exit will be re-triggered.", key, e.what());
            ledger_.clearExitPending(key);
        }
    });
    if (!posted) {
        logger->error("Exit for {} could not be queued, will retry next cycle.", key);
        ledger_.clearExitPending(key);
        return false;
    }
    return true;
}

void PositionMonitor::executeExit(const std::string& instrument_key, double price, core::ExitReason reason,
                                  core::Timestamp now)
{
    auto logger = core::logging::getLogger();

    // The ledger may have dropped or settled the position while the job was queued
    auto position = ledger_.get(instrument_key);
    if (!position || !position->exit_pending) {
        logger->warn("Exit for {} skipped: position no longer awaiting an exit.", instrument_key);
        return;
    }

    OrderRequest request;
    request.instrument_key = instrument_key;
    request.side = exitSide(position->direction);
    request.quantity = position->quantity;
    request.reference_price = price;
    request.tag = fmt::format("EXIT_{}", core::exitReasonToString(reason));
    request.client_order_id = position->exit_client_order_id;

    OrderResult result = orders_.placeOrder(request);
    if (!result.ok()) {
        logger->error("Exit order for {} failed ({}): {}. Position stays open, exit will be re-triggered.",
                      instrument_key, orderErrorKindToString(result.error->kind), result.error->message);
        publish(audit::AuditEventType::OrderFailed, instrument_key,
                {{"client_order_id", request.client_order_id}, {"side", orderSideToString(request.side)},
                 {"quantity", request.quantity}, {"error", orderErrorKindToString(result.error->kind)},
                 {"message", result.error->message}, {"exit_reason", core::exitReasonToString(reason)}}, now);
        ledger_.clearExitPending(instrument_key);
        return;
    }

    auto trade = ledger_.recordExitFill(instrument_key, result.filled_quantity, result.fill_price, now,
                                        core::exitReasonToString(reason));
    if (!trade) {
        logger->error("Exit order {} for {} reported no usable fill ({} filled).", result.order_id, instrument_key,
                      result.filled_quantity);
        ledger_.clearExitPending(instrument_key);
        return;
    }

    nlohmann::json payload = {{"order_id", result.order_id}, {"direction", core::directionToString(trade->direction)},
                              {"quantity", trade->quantity}, {"entry", trade->entry_price}, {"exit", trade->exit_price},
                              {"pnl", trade->pnl}, {"return_pct", trade->return_pct}, {"exit_reason", trade->exit_reason}};
    auto remaining = ledger_.get(instrument_key);
    if (remaining) {
        payload["remaining_quantity"] = remaining->quantity;
        publish(audit::AuditEventType::PositionReduced, instrument_key, payload, now);
    } else {
        publish(audit::AuditEventType::PositionClosed, instrument_key, payload, now);
    }
}

void PositionMonitor::publish(audit::AuditEventType type, const std::string& instrument_key, nlohmann::json payload,
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
