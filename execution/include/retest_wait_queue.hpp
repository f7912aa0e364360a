#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"

namespace execution {

    struct RetestFill {
        core::PendingRetest retest;
        double price = 0.0; // Price at the qualifying touch
    };

    struct RetestEvaluation {
        std::vector<RetestFill> filled;
        std::vector<core::PendingRetest> expired;
        std::vector<core::PendingRetest> invalidated; // Price went through the stop before touching
    };

    // Breakout entries waiting for a pullback to the broken level.
    // Per instrument: NONE -> PENDING -> FILLED | EXPIRED | INVALIDATED.
    // A touch fills only after the price has traded beyond the band.
    class RetestWaitQueue {
    public:
        RetestWaitQueue(std::chrono::minutes timeout, double tolerance_pct);

        // False (and nothing changes) when the instrument is already pending
        bool enqueue(const core::Signal& signal, long long quantity, core::Timestamp now);

        // Resolves every pending entry against the latest prices; resolved entries are removed
        RetestEvaluation evaluate(const std::map<std::string, double>& prices, core::Timestamp now);

        // Price within the tolerance band of the level. Only counts once the
        // price has been beyond the band on the breakout side.
        bool isTouch(const core::PendingRetest& retest, double price) const;
        bool isBeyondBand(const core::PendingRetest& retest, double price) const;

        bool has(const std::string& instrument_key) const;
        std::optional<core::PendingRetest> get(const std::string& instrument_key) const;
        std::vector<core::PendingRetest> pending() const;
        std::size_t size() const;

        // Drops every pending entry, e.g. at session flatten
        std::vector<core::PendingRetest> clear();

    private:
        const std::chrono::minutes timeout_;
        const double tolerance_pct_;

        mutable std::mutex mutex_;
        std::map<std::string, core::PendingRetest> pending_;
    };

} // namespace execution
