#pragma once

#include <map>
#include <mutex>
#include <string>

#include "datatypes.hpp"
#include "engine_config.hpp"
#include "session_calendar.hpp"
#include "audit_event.hpp"
#include "position_ledger.hpp"
#include "resilient_order_client.hpp"
#include "order_worker.hpp"
#include "trade_executor.hpp"

namespace execution {

    struct MonitorCycleResult {
        int positions_checked = 0;
        int stops_adjusted = 0;
        int exits_triggered = 0;
        int retests_filled = 0;
        int retests_expired = 0;
    };

    // Fast loop over open positions. Per position and cycle, in order:
    // peak update, breakeven move, trailing ratchet, exit checks (stop,
    // target, session flatten). Exits are handed to the exit worker; the
    // position stays in the ledger with exitPending until the fill is confirmed.
    class PositionMonitor {
    public:
        PositionMonitor(core::MonitorConfig config,
                        PositionLedger& ledger,
                        TradeExecutor& executor,
                        ResilientOrderClient& orders,
                        OrderWorker& exit_worker,
                        const core::SessionCalendar& calendar,
                        audit::IAuditPublisher* publisher = nullptr);

        MonitorCycleResult runCycle(const std::map<std::string, double>& prices, core::Timestamp now);

        // Breakeven / trailing for one position, returns the stop it should have now (never looser)
        double ratchetStop(const core::Position& position, bool breakeven_this_cycle) const;

        // Exit decision for one position at price, ignoring the session flatten
        std::optional<core::ExitReason> checkExit(const core::Position& position, double price) const;

    private:
        // Posts the closing order; returns false when the job could not be queued
        bool submitExit(const core::Position& position, double price, core::ExitReason reason, core::Timestamp now);
        // Runs on the exit worker against the ledger's current state of the position
        void executeExit(const std::string& instrument_key, double price, core::ExitReason reason, core::Timestamp now);
        void publish(audit::AuditEventType type, const std::string& instrument_key, nlohmann::json payload, core::Timestamp now);

        core::MonitorConfig config_;
        PositionLedger& ledger_;
        TradeExecutor& executor_;
        ResilientOrderClient& orders_;
        OrderWorker& exit_worker_;
        const core::SessionCalendar& calendar_;
        audit::IAuditPublisher* publisher_;

        // Session whose flatten has been announced, only touched from the monitor loop
        std::string flattened_session_;
    };

} // namespace execution
