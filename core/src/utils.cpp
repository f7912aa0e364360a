#include "utils.hpp"
#include "exceptions.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>
#include <string>
#include <cctype>
#include <cmath>      // For std::pow
#include <chrono>
#include <ctime>
#include <spdlog/fmt/fmt.h>

namespace core {
namespace utils {

    namespace {

        std::tm toExchangeTm(const Timestamp& ts) {
            auto tt_local = std::chrono::system_clock::to_time_t(ts + kExchangeUtcOffset);
            std::tm time_tm;
            // Format the shifted instant as if it were UTC to get exchange wall-clock fields
            gmtime_r(&tt_local, &time_tm);
            return time_tm;
        }

    } // end anonymous namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw DataException("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore();
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration{0};
        char sign_or_z = 0;
        if (!(ss >> sign_or_z)) {
            throw DataException("Timestamp missing or invalid timezone offset/indicator: " + iso_string);
        }
        if (sign_or_z == '+' || sign_or_z == '-') {
            int offset_h = 0;
            int offset_m = 0;
            char colon = ' ';
            if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                throw DataException("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
            }
            offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
            if (sign_or_z == '-') {
                offset_duration *= -1;
            }
        } else if (sign_or_z != 'Z') {
            throw DataException("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
        }

        // 4. timegm interprets the fields as UTC, the offset is removed afterwards
        time_t tt = timegm(&tm);
        if (tt == static_cast<time_t>(-1)) {
            throw DataException("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2015-04-20T00:00:00+05:30 -> 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        std::tm time_tm = toExchangeTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << "+05:30";
        return oss.str();
    }

    Timestamp floorToInterval(const Timestamp& ts, std::chrono::seconds interval) {
        if (interval.count() <= 0) {
            return ts;
        }
        auto since_epoch = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch());
        auto remainder = since_epoch % interval;
        if (remainder.count() < 0) {
            remainder += interval;
        }
        return Timestamp(std::chrono::duration_cast<Timestamp::duration>(since_epoch - remainder));
    }

    int exchangeMinuteOfDay(const Timestamp& ts) {
        std::tm time_tm = toExchangeTm(ts);
        return time_tm.tm_hour * 60 + time_tm.tm_min;
    }

    std::string exchangeDate(const Timestamp& ts) {
        std::tm time_tm = toExchangeTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

    int parseTimeOfDay(const std::string& hhmm) {
        int hours = -1;
        int minutes = -1;
        char colon = 0;
        std::istringstream ss(hhmm);
        if (!(ss >> hours >> colon >> minutes) || colon != ':' ||
            hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
            throw ConfigException(fmt::format("Invalid time of day '{}', expected HH:MM", hhmm));
        }
        return hours * 60 + minutes;
    }

    std::int64_t toEpochMillis(const Timestamp& ts) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    }

    Timestamp fromEpochMillis(std::int64_t millis) {
        return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
    }

} // namespace utils
} // namespace core
