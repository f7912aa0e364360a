#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"

namespace execution {

    // Authoritative local record of open positions and the round trips closed
    // today. Every method takes the one ledger mutex; callers get copies.
    class PositionLedger {
    public:
        // False when the instrument already has a position
        bool add(const core::Position& position);

        // Forced removal. Returns the removed position.
        std::optional<core::Position> remove(const std::string& instrument_key);

        // Reconciliation removal: only when no exit is in flight and the position
        // was opened at or before opened_before, checked under the ledger lock
        std::optional<core::Position> removeIfIdle(const std::string& instrument_key, core::Timestamp opened_before);

        // Removes the position and records the completed trade
        std::optional<core::Trade> close(const std::string& instrument_key, double exit_price,
                                         core::Timestamp exit_time, const std::string& exit_reason);

        // Books a confirmed exit fill of filled_quantity. A partial fill records a trade
        // for the filled part, shrinks the position and clears the pending exit so the
        // remainder is exited again; the full quantity closes the position.
        std::optional<core::Trade> recordExitFill(const std::string& instrument_key, long long filled_quantity,
                                                  double exit_price, core::Timestamp exit_time,
                                                  const std::string& exit_reason);

        std::optional<core::Position> get(const std::string& instrument_key) const;
        std::vector<core::Position> getAll() const;
        bool has(const std::string& instrument_key) const;
        std::size_t size() const;

        // Only tightens: a long's stop moves up, a short's down. False when rejected.
        bool updateStop(const std::string& instrument_key, double new_stop);

        // Records a new favorable extreme; ignored when not more favorable
        bool updatePeak(const std::string& instrument_key, double price);

        // Stop to entry and breakevenMoved set, at most once per position
        bool moveToBreakeven(const std::string& instrument_key);

        // False when missing or already pending. client_order_id is kept only when the
        // position has no exit id yet; an unconfirmed earlier exit keeps its id.
        bool markExitPending(const std::string& instrument_key, core::ExitReason reason,
                             const std::string& client_order_id = {});
        // Attempt failed without a confirmed fill: pending cleared, exit id kept
        bool clearExitPending(const std::string& instrument_key);

        std::vector<core::Trade> tradeLog() const;
        double realizedPnl() const;

    private:
        static bool isTighter(const core::Position& position, double new_stop);

        mutable std::mutex mutex_;
        std::map<std::string, core::Position> positions_;
        std::vector<core::Trade> trade_log_;
    };

} // namespace execution
