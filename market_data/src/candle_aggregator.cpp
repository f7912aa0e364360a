#include "candle_aggregator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>

namespace market_data {

    CandleAggregator::CandleAggregator(std::size_t tick_capacity, std::chrono::seconds bar_interval, std::size_t max_bars)
        : tick_capacity_(tick_capacity), bar_interval_(bar_interval), max_bars_(max_bars)
    {
        if (tick_capacity_ == 0 || bar_interval_.count() <= 0 || max_bars_ == 0) {
            throw core::ConfigException("CandleAggregator requires positive tick capacity, bar interval and max bars");
        }
        core::logging::getLogger()->debug("CandleAggregator created: capacity={}, interval={}s, max_bars={}",
                                          tick_capacity_, bar_interval_.count(), max_bars_);
    }

    void CandleAggregator::ingest(const core::Tick& tick) {
        if (tick.instrument_key.empty() || !std::isfinite(tick.price) || tick.price <= 0.0) {
            core::logging::getLogger()->debug("Discarding invalid tick for '{}' (price {})", tick.instrument_key, tick.price);
            return;
        }
        std::string session_date = core::utils::exchangeDate(tick.timestamp);

        std::lock_guard<std::mutex> lock(mutex_);
        InstrumentBook& book = books_[tick.instrument_key];
        if (book.ticks.size() >= tick_capacity_) {
            book.ticks.pop_front();
            book.truncated = true;
            dropped_ticks_.fetch_add(1);
        }
        book.ticks.push_back(tick);
        book.last_price = tick.price;
        if (book.session_date != session_date) {
            book.session_date = session_date;
            book.session_open = tick.price;
        }
    }

    void CandleAggregator::rebuild() {
        // Copy the rings out so bucketing runs without the lock
        std::map<std::string, std::pair<std::deque<core::Tick>, bool>> work;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& entry : books_) {
                if (!entry.second.ticks.empty()) {
                    work.emplace(entry.first, std::make_pair(entry.second.ticks, entry.second.truncated));
                }
            }
        }

        for (auto& item : work) {
            const std::string& instrument = item.first;
            std::deque<core::Tick>& ticks = item.second.first;
            const bool truncated = item.second.second;

            // Ticks can arrive slightly out of order across reconnects
            std::stable_sort(ticks.begin(), ticks.end(),
                             [](const core::Tick& a, const core::Tick& b) { return a.timestamp < b.timestamp; });

            std::map<core::Timestamp, core::Candle> rebuilt;
            for (const auto& tick : ticks) {
                core::Timestamp bucket = core::utils::floorToInterval(tick.timestamp, bar_interval_);
                long long volume = tick.size.value_or(0);
                auto it = rebuilt.find(bucket);
                if (it == rebuilt.end()) {
                    core::Candle candle;
                    candle.instrument_key = instrument;
                    candle.timestamp = bucket;
                    candle.open = candle.high = candle.low = candle.close = tick.price;
                    candle.volume = volume;
                    rebuilt.emplace(bucket, candle);
                } else {
                    core::Candle& candle = it->second;
                    candle.high = std::max(candle.high, tick.price);
                    candle.low = std::min(candle.low, tick.price);
                    candle.close = tick.price;
                    candle.volume += volume;
                }
            }
            if (rebuilt.empty()) {
                continue;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            InstrumentBook& book = books_[instrument];
            auto first_bucket = rebuilt.begin()->first;
            for (auto& entry : rebuilt) {
                // Once the ring dropped ticks its oldest bucket is incomplete; keep the bar we already have
                if (truncated && entry.first == first_bucket && book.bars.count(entry.first) > 0) {
                    continue;
                }
                book.bars[entry.first] = entry.second;
            }
            trimBars(book);
        }
    }

    void CandleAggregator::mergeHistorical(const std::string& instrument_key, const core::TimeSeries<core::Candle>& bars) {
        auto logger = core::logging::getLogger();
        std::size_t merged = 0;
        std::size_t skipped = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            InstrumentBook& book = books_[instrument_key];
            for (const auto& bar : bars) {
                if (!std::isfinite(bar.close) || bar.close <= 0.0) {
                    ++skipped;
                    continue;
                }
                core::Candle candle = bar;
                candle.instrument_key = instrument_key;
                candle.timestamp = core::utils::floorToInterval(bar.timestamp, bar_interval_);
                book.bars[candle.timestamp] = candle;
                ++merged;
            }
            trimBars(book);
        }
        logger->info("Merged {} historical bars for {} ({} skipped)", merged, instrument_key, skipped);
    }

    core::TimeSeries<core::Candle> CandleAggregator::snapshot(const std::string& instrument_key) const {
        core::TimeSeries<core::Candle> result;
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(instrument_key);
        if (it == books_.end()) {
            return result;
        }
        result.reserve(it->second.bars.size());
        for (const auto& entry : it->second.bars) {
            result.push_back(entry.second);
        }
        return result;
    }

    std::optional<double> CandleAggregator::latestPrice(const std::string& instrument_key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(instrument_key);
        if (it == books_.end()) {
            return std::nullopt;
        }
        if (it->second.last_price) {
            return it->second.last_price;
        }
        // Warm-up only: fall back to the last historical close
        if (!it->second.bars.empty()) {
            return it->second.bars.rbegin()->second.close;
        }
        return std::nullopt;
    }

    std::map<std::string, double> CandleAggregator::latestPrices() const {
        std::map<std::string, double> prices;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : books_) {
            if (entry.second.last_price) {
                prices[entry.first] = *entry.second.last_price;
            }
        }
        return prices;
    }

    std::optional<double> CandleAggregator::sessionOpenPrice(const std::string& instrument_key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(instrument_key);
        if (it == books_.end()) {
            return std::nullopt;
        }
        return it->second.session_open;
    }

    std::vector<std::string> CandleAggregator::instruments() const {
        std::vector<std::string> keys;
        std::lock_guard<std::mutex> lock(mutex_);
        keys.reserve(books_.size());
        for (const auto& entry : books_) {
            keys.push_back(entry.first);
        }
        return keys;
    }

    std::size_t CandleAggregator::bufferedTickCount(const std::string& instrument_key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(instrument_key);
        return it == books_.end() ? 0 : it->second.ticks.size();
    }

    void CandleAggregator::trimBars(InstrumentBook& book) {
        while (book.bars.size() > max_bars_) {
            book.bars.erase(book.bars.begin());
        }
    }

} // namespace market_data
