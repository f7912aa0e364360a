#include "audit_event.hpp"
#include "utils.hpp"

namespace audit {

    const char* auditEventTypeToString(AuditEventType type) {
        switch (type) {
            case AuditEventType::ScreeningVerdict: return "SCREENING_VERDICT";
            case AuditEventType::OrderPlaced: return "ORDER_PLACED";
            case AuditEventType::OrderFailed: return "ORDER_FAILED";
            case AuditEventType::PositionOpened: return "POSITION_OPENED";
            case AuditEventType::PositionClosed: return "POSITION_CLOSED";
            case AuditEventType::PositionReduced: return "POSITION_REDUCED";
            case AuditEventType::StopAdjusted: return "STOP_ADJUSTED";
            case AuditEventType::RetestQueued: return "RETEST_QUEUED";
            case AuditEventType::RetestFilled: return "RETEST_FILLED";
            case AuditEventType::RetestExpired: return "RETEST_EXPIRED";
            case AuditEventType::RetestInvalidated: return "RETEST_INVALIDATED";
            case AuditEventType::PhantomPositionRemoved: return "PHANTOM_POSITION_REMOVED";
            case AuditEventType::OrphanVenuePosition: return "ORPHAN_VENUE_POSITION";
            case AuditEventType::QuantityMismatch: return "QUANTITY_MISMATCH";
            case AuditEventType::EntriesSuspended: return "ENTRIES_SUSPENDED";
            case AuditEventType::EngineStarted: return "ENGINE_STARTED";
            case AuditEventType::EngineStopped: return "ENGINE_STOPPED";
        }
        return "UNKNOWN";
    }

    nlohmann::json signalToJson(const core::Signal& signal) {
        return {
            {"instrument", signal.instrument_key},
            {"direction", core::directionToString(signal.direction)},
            {"entry", signal.entry_price},
            {"stop_loss", signal.stop_loss},
            {"target", signal.target},
            {"strategy", signal.strategy_id},
            {"confidence", signal.confidence},
            {"rationale", signal.rationale},
            {"requires_retest", signal.requires_retest},
            {"time", core::utils::timestampToString(signal.timestamp)}
        };
    }

    nlohmann::json verdictToJson(const core::ScreeningVerdict& verdict) {
        nlohmann::json levels = nlohmann::json::array();
        for (const auto& outcome : verdict.outcomes) {
            levels.push_back({
                {"level", outcome.level},
                {"passed", outcome.passed},
                {"critical", outcome.critical},
                {"fail_open_applied", outcome.fail_open_applied},
                {"internal_error", outcome.internal_error},
                {"reason", outcome.reason}
            });
        }
        nlohmann::json result = {
            {"passed", verdict.passed},
            {"reason", verdict.reason},
            {"critical", verdict.is_critical},
            {"levels", levels}
        };
        result["blocking_level"] = verdict.blocking_level ? nlohmann::json(*verdict.blocking_level) : nlohmann::json();
        return result;
    }

    nlohmann::json positionToJson(const core::Position& position) {
        return {
            {"instrument", position.instrument_key},
            {"direction", core::directionToString(position.direction)},
            {"entry", position.entry_price},
            {"quantity", position.quantity},
            {"stop_loss", position.stop_loss},
            {"target", position.target},
            {"breakeven_moved", position.breakeven_moved},
            {"peak", position.peak_favorable_price},
            {"order_id", position.order_id},
            {"strategy", position.strategy_id}
        };
    }

} // namespace audit
