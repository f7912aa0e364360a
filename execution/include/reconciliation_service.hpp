#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "engine_config.hpp"
#include "audit_event.hpp"
#include "position_ledger.hpp"
#include "resilient_order_client.hpp"

namespace execution {

    struct ReconciliationReport {
        bool completed = false; // False when venue positions could not be fetched
        core::Timestamp at;
        std::vector<std::string> phantoms_removed;
        std::vector<std::string> orphans;
        std::vector<std::string> quantity_mismatches;
        int skipped = 0; // Too young or exit pending
    };

    // Diffs the ledger against the venue. The venue is authoritative for
    // existence: a local-only position is removed, a venue-only position is
    // reported and never adopted.
    class ReconciliationService {
    public:
        ReconciliationService(core::ReconciliationConfig config,
                              PositionLedger& ledger,
                              ResilientOrderClient& orders,
                              audit::IAuditPublisher* publisher = nullptr);

        ReconciliationReport runOnce(core::Timestamp now);

        std::optional<core::Timestamp> lastCompleted() const;

    private:
        void publish(audit::AuditEventType type, const std::string& instrument_key, nlohmann::json payload, core::Timestamp now);

        core::ReconciliationConfig config_;
        PositionLedger& ledger_;
        ResilientOrderClient& orders_;
        audit::IAuditPublisher* publisher_;

        mutable std::mutex mutex_;
        std::optional<core::Timestamp> last_completed_;
    };

} // namespace execution
