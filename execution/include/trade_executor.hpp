#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>

#include "datatypes.hpp"
#include "engine_config.hpp"
#include "audit_event.hpp"
#include "screening_pipeline.hpp"
#include "position_ledger.hpp"
#include "retest_wait_queue.hpp"
#include "resilient_order_client.hpp"
#include "order_worker.hpp"

namespace execution {

    enum class EntryOutcome {
        Placed,          // Entry order filled, position open
        Queued,          // Waiting for a retest
        Occupied,        // Position, pending retest or in-flight entry already exists
        Blocked,         // Screening said no
        Suspended,       // Entries suspended (authentication failure)
        SizingRejected,  // Zero risk distance or no capacity
        OrderFailed
    };

    const char* entryOutcomeToString(EntryOutcome outcome);

    // Turns screened signals into positions. Guarantees at most one of
    // {position, pending retest, in-flight entry} per instrument even when the
    // strategy loop and retest fills race.
    class TradeExecutor {
    public:
        TradeExecutor(core::RiskConfig risk,
                      screening::ScreeningPipeline& pipeline,
                      PositionLedger& ledger,
                      RetestWaitQueue& retests,
                      ResilientOrderClient& orders,
                      OrderWorker& entry_worker,
                      audit::IAuditPublisher* publisher = nullptr);

        // Screens the signal and either places the entry (blocking on the order) or queues a retest
        EntryOutcome submitSignal(const core::Signal& signal, const screening::MarketState& state, core::Timestamp now);

        // Resolves the retest queue. Filled entries are claimed here and ordered on the entry worker.
        RetestEvaluation evaluateRetests(const std::map<std::string, double>& prices, core::Timestamp now);

        // Drops every pending retest (session flatten), auditing each as expired
        std::size_t cancelPendingRetests(const std::string& reason, core::Timestamp now);

        // Places the order for a claimed retest fill (runs on the entry worker)
        EntryOutcome fillRetest(const RetestFill& fill, core::Timestamp now);

        bool isOccupied(const std::string& instrument_key) const;

        // floor(capital * risk% / |entry - stop|) clamped to [1, max_quantity]; 0 when there is no risk distance
        long long positionSize(double entry_price, double stop_loss) const;

        void suspendEntries(const std::string& reason, core::Timestamp now);
        void resumeEntries();
        bool entriesSuspended() const { return entries_suspended_.load(); }

        std::size_t inFlightCount() const;

    private:
        // Claims the instrument for an entry; false when occupied
        bool claim(const std::string& instrument_key);
        void release(const std::string& instrument_key);

        EntryOutcome placeEntry(const std::string& instrument_key, core::Direction direction, long long quantity,
                                double reference_price, double stop_loss, double target,
                                const std::string& strategy_id, core::Timestamp now);

        void publish(audit::AuditEventType type, const std::string& instrument_key, nlohmann::json payload,
                     core::Timestamp now);

        core::RiskConfig risk_;
        screening::ScreeningPipeline& pipeline_;
        PositionLedger& ledger_;
        RetestWaitQueue& retests_;
        ResilientOrderClient& orders_;
        OrderWorker& entry_worker_;
        audit::IAuditPublisher* publisher_;

        mutable std::mutex entry_mutex_;
        std::set<std::string> in_flight_;
        std::atomic<bool> entries_suspended_{false};
    };

} // namespace execution
