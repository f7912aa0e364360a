#pragma once

#include "datatypes.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace market_data {

    // Turns the live tick stream into fixed-interval bars per instrument.
    //
    // ingest() is called from the feed thread and only appends to a bounded
    // per-instrument ring; rebuild() runs on its own schedule and folds the
    // buffered ticks into bars. Readers get defensive copies via snapshot().
    class CandleAggregator {
    public:
        CandleAggregator(std::size_t tick_capacity, std::chrono::seconds bar_interval, std::size_t max_bars);

        // Non-blocking apart from a short critical section. Oldest tick is dropped when the ring is full.
        void ingest(const core::Tick& tick);

        // Regroup buffered ticks into bars (open=first, high=max, low=min, close=last, volume=sum)
        void rebuild();

        // Merge bars fetched at startup. Same interval start -> most recent write wins.
        void mergeHistorical(const std::string& instrument_key, const core::TimeSeries<core::Candle>& bars);

        // Ordered copy of the bar sequence, empty for unknown instruments
        core::TimeSeries<core::Candle> snapshot(const std::string& instrument_key) const;

        std::optional<double> latestPrice(const std::string& instrument_key) const;
        std::map<std::string, double> latestPrices() const;

        // First traded price of the current exchange session
        std::optional<double> sessionOpenPrice(const std::string& instrument_key) const;

        std::vector<std::string> instruments() const;
        std::size_t bufferedTickCount(const std::string& instrument_key) const;
        std::uint64_t droppedTickCount() const { return dropped_ticks_.load(); }

        std::chrono::seconds barInterval() const { return bar_interval_; }

    private:
        struct InstrumentBook {
            std::deque<core::Tick> ticks;
            std::map<core::Timestamp, core::Candle> bars; // keyed by interval start
            std::optional<double> last_price;
            std::optional<double> session_open;
            std::string session_date;
            bool truncated = false; // Ring has dropped ticks, its oldest bucket may be partial
        };

        void trimBars(InstrumentBook& book);

        const std::size_t tick_capacity_;
        const std::chrono::seconds bar_interval_;
        const std::size_t max_bars_;

        mutable std::mutex mutex_;
        std::map<std::string, InstrumentBook> books_;
        std::atomic<std::uint64_t> dropped_ticks_{0};
    };

} // namespace market_data
