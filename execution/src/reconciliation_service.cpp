#include "reconciliation_service.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <map>

namespace execution {

ReconciliationService::ReconciliationService(core::ReconciliationConfig config,
                                             PositionLedger& ledger,
                                             ResilientOrderClient& orders,
                                             audit::IAuditPublisher* publisher)
    : config_(config), ledger_(ledger), orders_(orders), publisher_(publisher) {}

std::optional<core::Timestamp> ReconciliationService::lastCompleted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_completed_;
}

ReconciliationReport ReconciliationService::runOnce(core::Timestamp now) {
    auto logger = core::logging::getLogger();
    ReconciliationReport report;
    report.at = now;

    std::vector<core::VenuePosition> venue_positions;
    try {
        venue_positions = orders_.getOpenPositions();
    } catch (const core::TransientException& e) {
        logger->error("Reconciliation skipped: venue positions unavailable: {}", e.what());
        return report;
    } catch (const core::AuthenticationException& e) {
        logger->error("Reconciliation skipped: authentication failed: {}", e.what());
        return report;
    }

    std::map<std::string, core::VenuePosition> venue;
    for (const auto& vp : venue_positions) {
        if (vp.net_quantity != 0) {
            venue[vp.instrument_key] = vp;
        }
    }

    // --- Local positions vs venue ---
    for (const auto& position : ledger_.getAll()) {
        const std::string& key = position.instrument_key;
        if (position.exit_pending || now - position.opened_at < config_.grace_period) {
            ++report.skipped;
            logger->debug("Reconciliation: {} not judged ({}).", key, position.exit_pending ? "exit pending" : "inside grace period");
            continue;
        }

        auto it = venue.find(key);
        if (it == venue.end()) {
            // An exit may have started since the snapshot
            auto removed = ledger_.removeIfIdle(key, now - config_.grace_period);
            if (!removed) {
                ++report.skipped;
                continue;
            }
            logger->warn("Reconciliation: phantom position {} {} x{} (order {}) has no venue counterpart - removed.",
                         key, core::directionToString(removed->direction), removed->quantity, removed->order_id);
            auto payload = audit::positionToJson(*removed);
            payload["reason"] = "no matching venue position";
            publish(audit::AuditEventType::PhantomPositionRemoved, key, payload, now);
            report.phantoms_removed.push_back(key);
            continue;
        }

        long long expected = position.isLong() ? position.quantity : -position.quantity;
        if (it->second.net_quantity != expected) {
            logger->warn("Reconciliation: quantity mismatch for {}: local {} vs venue {}.", key, expected, it->second.net_quantity);
            publish(audit::AuditEventType::QuantityMismatch, key,
                    {{"local_quantity", expected}, {"venue_quantity", it->second.net_quantity},
                     {"venue_average_price", it->second.average_price}}, now);
            report.quantity_mismatches.push_back(key);
        }
    }

    // --- Venue positions the ledger does not know ---
    for (const auto& pair : venue) {
        if (ledger_.has(pair.first)) continue;
        logger->warn("Reconciliation: orphan venue position {} net {} @ {:.2f} - not adopted, needs manual review.",
                     pair.first, pair.second.net_quantity, pair.second.average_price);
        publish(audit::AuditEventType::OrphanVenuePosition, pair.first,
                {{"net_quantity", pair.second.net_quantity}, {"average_price", pair.second.average_price}}, now);
        report.orphans.push_back(pair.first);
    }

    report.completed = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_completed_ = now;
    }
    logger->info("Reconciliation at {}: {} venue, {} phantom(s) removed, {} orphan(s), {} mismatch(es), {} skipped.",
                 core::utils::timestampToString(now), venue.size(), report.phantoms_removed.size(),
                 report.orphans.size(), report.quantity_mismatches.size(), report.skipped);
    return report;
}

void ReconciliationService::publish(audit::AuditEventType type, const std::string& instrument_key, nlohmann::json payload,
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
