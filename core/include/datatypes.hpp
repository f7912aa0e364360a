#pragma once

#include <string>
#include <vector>
#include <chrono>   // For timestamps
#include <cmath>
#include <optional> // For nullable fields like tick size

namespace core {

    // All timestamps are UTC instants; IST is only applied for display and session rules
    using Timestamp = std::chrono::system_clock::time_point;

    enum class Direction {
        Long,
        Short
    };

    inline const char* directionToString(Direction direction) {
        return direction == Direction::Long ? "LONG" : "SHORT";
    }

    // Raw price update from the market feed. Never persisted.
    struct Tick {
        std::string instrument_key;
        double price = 0.0;
        std::optional<long long> size; // Some feeds only send LTP
        Timestamp timestamp;
    };

    struct Candle {
        std::string instrument_key;
        Timestamp timestamp; // Interval start (UTC)
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0;

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Immutable trade candidate produced by a signal generator
    struct Signal {
        Timestamp timestamp;
        std::string instrument_key;
        Direction direction = Direction::Long;
        double entry_price = 0.0;
        double stop_loss = 0.0;
        double target = 0.0;
        std::string strategy_id;
        double confidence = 0.0; // 0..100
        std::string rationale;
        bool requires_retest = false; // Breakouts wait for a pullback before entering

        double riskPerUnit() const { return std::abs(entry_price - stop_loss); }

        double rewardToRisk() const {
            double risk = riskPerUnit();
            return risk > 0.0 ? std::abs(target - entry_price) / risk : 0.0;
        }
    };

    // --- Screening ---
    struct LevelOutcome {
        std::string level;
        bool passed = false;
        bool critical = false;
        bool fail_open_applied = false; // Failed/errored but let through
        bool internal_error = false;
        std::string reason;
    };

    struct ScreeningVerdict {
        bool passed = true;
        std::optional<std::string> blocking_level;
        std::string reason;
        bool is_critical = false;
        std::vector<LevelOutcome> outcomes;
    };

    struct PendingRetest {
        std::string instrument_key;
        Direction direction = Direction::Long;
        double breakout_price = 0.0;
        double stop_loss = 0.0;
        double target = 0.0;
        long long quantity = 0;
        std::string strategy_id;
        Timestamp created_at;
        Timestamp deadline;
        bool departed = false; // Traded beyond the tolerance band since the breakout
    };

    enum class ExitReason {
        StopLoss,
        Target,
        SessionFlatten
    };

    inline const char* exitReasonToString(ExitReason reason) {
        switch (reason) {
            case ExitReason::StopLoss: return "STOP_LOSS";
            case ExitReason::Target: return "TARGET";
            case ExitReason::SessionFlatten: return "SESSION_FLATTEN";
        }
        return "UNKNOWN";
    }

    struct Position {
        std::string instrument_key;
        Direction direction = Direction::Long;
        double entry_price = 0.0;
        long long quantity = 0; // Always positive, side is carried by direction
        double stop_loss = 0.0;
        double initial_stop_loss = 0.0; // Risk unit for breakeven trigger
        double target = 0.0;
        bool breakeven_moved = false;
        double peak_favorable_price = 0.0;
        std::string order_id;
        std::string strategy_id;
        Timestamp opened_at;

        // Set while a closing order is in flight
        bool exit_pending = false;
        std::optional<ExitReason> exit_reason;
        // Correlation id of the current exit, reused on every retry until a fill is confirmed
        std::string exit_client_order_id;

        bool isLong() const { return direction == Direction::Long; }
        double initialRisk() const { return std::abs(entry_price - initial_stop_loss); }
    };

    // Broker-side view of a holding, authoritative for reconciliation
    struct VenuePosition {
        std::string instrument_key;
        long long net_quantity = 0; // Positive long, negative short
        double average_price = 0.0;
    };

    // Completed round trip
    struct Trade {
        std::string instrument_key;
        Direction direction = Direction::Long;
        std::string strategy_id;
        Timestamp entry_time;
        Timestamp exit_time;
        long long quantity = 0;
        double entry_price = 0.0;
        double exit_price = 0.0;
        double pnl = 0.0;
        double return_pct = 0.0; // PnL / Entry Value
        std::string exit_reason;
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

} // namespace core
