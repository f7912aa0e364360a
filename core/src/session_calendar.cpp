#include "session_calendar.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

namespace core {

    SessionCalendar::SessionCalendar(SessionConfig config) : config_(std::move(config)) {
        if (config_.market_open_minute >= config_.market_close_minute) {
            throw ConfigException(fmt::format("Market open ({}) must precede market close ({})",
                                              config_.market_open_minute, config_.market_close_minute));
        }
        if (config_.flatten_minute < config_.market_open_minute ||
            config_.flatten_minute > config_.market_close_minute) {
            throw ConfigException("Flatten time must fall inside the trading session");
        }
        for (const auto& window : config_.blackout_windows) {
            if (window.start_minute >= window.end_minute) {
                throw ConfigException(fmt::format("Blackout window [{}, {}) is empty or inverted",
                                                  window.start_minute, window.end_minute));
            }
        }
    }

    bool SessionCalendar::isMarketOpen(const Timestamp& ts) const {
        int minute = utils::exchangeMinuteOfDay(ts);
        return minute >= config_.market_open_minute && minute < config_.market_close_minute;
    }

    bool SessionCalendar::isInBlackout(const Timestamp& ts) const {
        int minute = utils::exchangeMinuteOfDay(ts);
        for (const auto& window : config_.blackout_windows) {
            if (minute >= window.start_minute && minute < window.end_minute) {
                return true;
            }
        }
        return false;
    }

    bool SessionCalendar::isFlattenWindow(const Timestamp& ts) const {
        int minute = utils::exchangeMinuteOfDay(ts);
        return minute >= config_.flatten_minute && minute < config_.market_close_minute;
    }

    bool SessionCalendar::acceptsEntries(const Timestamp& ts) const {
        int minute = utils::exchangeMinuteOfDay(ts);
        return minute >= config_.market_open_minute && minute < config_.flatten_minute && !isInBlackout(ts);
    }

    std::string SessionCalendar::sessionDate(const Timestamp& ts) const {
        return utils::exchangeDate(ts);
    }

} // namespace core
