#pragma once

#include "datatypes.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace audit {

    enum class AuditEventType {
        ScreeningVerdict,
        OrderPlaced,
        OrderFailed,
        PositionOpened,
        PositionClosed,
        PositionReduced,
        StopAdjusted,
        RetestQueued,
        RetestFilled,
        RetestExpired,
        RetestInvalidated,
        PhantomPositionRemoved,
        OrphanVenuePosition,
        QuantityMismatch,
        EntriesSuspended,
        EngineStarted,
        EngineStopped
    };

    const char* auditEventTypeToString(AuditEventType type);

    struct AuditEvent {
        core::Timestamp timestamp;
        AuditEventType type = AuditEventType::EngineStarted;
        std::string instrument_key; // Empty for engine-wide events
        nlohmann::json payload = nlohmann::json::object();
    };

    // Durable destination for audit batches (database, file, ...).
    // Called only from the dispatcher's background thread.
    class IAuditSink {
    public:
        virtual ~IAuditSink() = default;
        virtual bool write(const std::vector<AuditEvent>& batch) = 0;
    };

    // What trading components see: fire-and-forget, must never block on I/O
    class IAuditPublisher {
    public:
        virtual ~IAuditPublisher() = default;
        // Returns false when the event was dropped
        virtual bool publish(AuditEvent event) = 0;
    };

    // Payload helpers shared by the components that audit
    nlohmann::json signalToJson(const core::Signal& signal);
    nlohmann::json verdictToJson(const core::ScreeningVerdict& verdict);
    nlohmann::json positionToJson(const core::Position& position);

} // namespace audit
