#pragma once

#include "datatypes.hpp"
#include <string>
#include <vector>

namespace core {

    struct TimeWindow {
        int start_minute = 0; // Exchange-local minutes since midnight, inclusive
        int end_minute = 0;   // Exclusive
    };

    struct SessionConfig {
        int market_open_minute = 9 * 60 + 15;
        int market_close_minute = 15 * 60 + 30;
        int flatten_minute = 15 * 60 + 15;
        std::vector<TimeWindow> blackout_windows; // No new entries inside these
    };

    class SessionCalendar {
    public:
        explicit SessionCalendar(SessionConfig config);

        bool isMarketOpen(const Timestamp& ts) const;
        bool isInBlackout(const Timestamp& ts) const;
        // True from the flatten time until market close
        bool isFlattenWindow(const Timestamp& ts) const;
        // True when new entries are allowed at ts
        bool acceptsEntries(const Timestamp& ts) const;
        std::string sessionDate(const Timestamp& ts) const;

        const SessionConfig& config() const { return config_; }

    private:
        SessionConfig config_;
    };

} // namespace core
