#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>
#include <cstdint>

namespace core {
namespace utils {

    // Exchange local offset (IST, +05:30)
    constexpr std::chrono::minutes kExchangeUtcOffset{330};

    // Timestamp -> "YYYY-MM-DDTHH:MM:SS+05:30"
    std::string timestampToString(const Timestamp& ts);

    // Parse ISO 8601 with a mandatory offset ("Z" or "+HH:MM") into a UTC Timestamp
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Start of the bucket containing ts, buckets aligned on the UTC epoch
    Timestamp floorToInterval(const Timestamp& ts, std::chrono::seconds interval);

    // Minutes since exchange-local midnight (0..1439)
    int exchangeMinuteOfDay(const Timestamp& ts);

    // Exchange-local calendar date, "YYYY-MM-DD"
    std::string exchangeDate(const Timestamp& ts);

    // "HH:MM" -> minutes since midnight. Throws ConfigException on malformed input.
    int parseTimeOfDay(const std::string& hhmm);

    std::int64_t toEpochMillis(const Timestamp& ts);
    Timestamp fromEpochMillis(std::int64_t millis);

} // namespace utils
} // namespace core
