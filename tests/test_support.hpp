#pragma once

// Fakes and builders shared by the engine tests

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <deque>
#include <functional>
#include <limits>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "clock.hpp"
#include "datatypes.hpp"
#include "exceptions.hpp"
#include "retry_policy.hpp"
#include "utils.hpp"
#include "indicators.hpp"
#include "audit_event.hpp"
#include "market_feed.hpp"
#include "order_gateway.hpp"
#include "historical_data_source.hpp"

namespace test_support {

    // Exchange-local wall clock time on a fixed trading day
    inline core::Timestamp at(const std::string& hhmmss, const std::string& date = "2026-01-05") {
        return core::utils::stringToTimestamp(date + "T" + hhmmss + "+05:30");
    }

    inline core::Candle makeBar(const std::string& key, core::Timestamp ts, double open, double high, double low,
                                double close, long long volume = 1000) {
        core::Candle c;
        c.instrument_key = key;
        c.timestamp = ts;
        c.open = open;
        c.high = high;
        c.low = low;
        c.close = close;
        c.volume = volume;
        return c;
    }

    // n one-minute bars ending just before `end`, close given by price(i)
    inline core::TimeSeries<core::Candle> makeBars(const std::string& key, std::size_t n, core::Timestamp end,
                                                   const std::function<double(std::size_t)>& price,
                                                   double half_range = 0.5, long long volume = 1000) {
        core::TimeSeries<core::Candle> bars;
        for (std::size_t i = 0; i < n; ++i) {
            auto ts = end - std::chrono::minutes(static_cast<int>(n - i));
            double close = price(i);
            double open = i == 0 ? close : price(i - 1);
            bars.push_back(makeBar(key, ts, open, std::max(open, close) + half_range,
                                   std::min(open, close) - half_range, close, volume));
        }
        return bars;
    }

    inline core::TimeSeries<core::Candle> flatBars(const std::string& key, std::size_t n, core::Timestamp end,
                                                   double price = 100.0) {
        return makeBars(key, n, end, [price](std::size_t) { return price; });
    }

    inline core::Tick makeTick(const std::string& key, double price, core::Timestamp ts, long long size = 10) {
        core::Tick t;
        t.instrument_key = key;
        t.price = price;
        t.size = size;
        t.timestamp = ts;
        return t;
    }

    inline core::Signal makeSignal(const std::string& key, core::Direction direction, double entry, double stop,
                                   double target, core::Timestamp ts = {}, const std::string& strategy = "mean_reversion") {
        core::Signal s;
        s.timestamp = ts;
        s.instrument_key = key;
        s.direction = direction;
        s.entry_price = entry;
        s.stop_loss = stop;
        s.target = target;
        s.strategy_id = strategy;
        s.confidence = 70.0;
        s.rationale = "test";
        return s;
    }

    inline core::Position makePosition(const std::string& key, core::Direction direction, double entry, double stop,
                                       double target, long long quantity, core::Timestamp opened_at) {
        core::Position p;
        p.instrument_key = key;
        p.direction = direction;
        p.entry_price = entry;
        p.stop_loss = stop;
        p.initial_stop_loss = stop;
        p.target = target;
        p.quantity = quantity;
        p.peak_favorable_price = entry;
        p.order_id = "ORD-" + key;
        p.strategy_id = "mean_reversion";
        p.opened_at = opened_at;
        return p;
    }

    // --- Clock ---
    class ManualClock : public core::IClock {
    public:
        explicit ManualClock(core::Timestamp start) : now_(start) {}

        core::Timestamp now() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return now_;
        }
        void set(core::Timestamp ts) {
            std::lock_guard<std::mutex> lock(mutex_);
            now_ = ts;
        }
        void advance(std::chrono::seconds by) {
            std::lock_guard<std::mutex> lock(mutex_);
            now_ += by;
        }

    private:
        mutable std::mutex mutex_;
        core::Timestamp now_;
    };

    // --- Audit ---
    class CapturingAuditPublisher : public audit::IAuditPublisher {
    public:
        bool publish(audit::AuditEvent event) override {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
            return true;
        }

        std::vector<audit::AuditEvent> events() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return events_;
        }

        std::size_t count(audit::AuditEventType type) const {
            std::lock_guard<std::mutex> lock(mutex_);
            std::size_t n = 0;
            for (const auto& e : events_) {
                if (e.type == type) ++n;
            }
            return n;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<audit::AuditEvent> events_;
    };

    class CapturingAuditSink : public audit::IAuditSink {
    public:
        bool write(const std::vector<audit::AuditEvent>& batch) override {
            std::lock_guard<std::mutex> lock(mutex_);
            ++write_calls_;
            if (fail_writes_) return false;
            events_.insert(events_.end(), batch.begin(), batch.end());
            return true;
        }

        void setFailWrites(bool fail) {
            std::lock_guard<std::mutex> lock(mutex_);
            fail_writes_ = fail;
        }
        std::size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return events_.size();
        }
        std::vector<audit::AuditEvent> events() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return events_;
        }
        int writeCalls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return write_calls_;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<audit::AuditEvent> events_;
        bool fail_writes_ = false;
        int write_calls_ = 0;
    };

    // --- Venue ---
    // Fills at the reference price unless a scripted result is queued; keeps net positions like a broker.
    // A client order id executes at most once: a repeat returns the original result.
    class FakeOrderGateway : public execution::OrderGateway {
    public:
        execution::OrderResult placeOrder(const execution::OrderRequest& request) override {
            std::unique_lock<std::mutex> lock(mutex_);
            requests_.push_back(request);
            if (!throw_next_.empty()) {
                std::string message = throw_next_;
                throw_next_.clear();
                throw std::runtime_error(message);
            }

            auto executed = executed_.find(request.client_order_id);
            if (executed != executed_.end()) {
                return respond(executed->second);
            }
            if (!scripted_.empty()) {
                auto scripted = scripted_.front();
                scripted_.pop_front();
                if (!scripted.ok()) {
                    return scripted;
                }
            }
            auto hook = before_fill_;
            lock.unlock();
            if (hook) hook(request);
            lock.lock();

            long long quantity = request.quantity;
            if (!partial_fills_.empty()) {
                quantity = std::min(quantity, partial_fills_.front());
                partial_fills_.pop_front();
            }
            long long signed_qty = request.side == execution::OrderSide::Buy ? quantity : -quantity;
            auto& vp = venue_[request.instrument_key];
            vp.instrument_key = request.instrument_key;
            vp.net_quantity += signed_qty;
            vp.average_price = request.reference_price;
            if (vp.net_quantity == 0) {
                venue_.erase(request.instrument_key);
            }
            auto result = execution::OrderResult::filled("FAKE-" + std::to_string(requests_.size()),
                                                         request.reference_price, quantity);
            if (!request.client_order_id.empty()) {
                executed_[request.client_order_id] = result;
            }
            return respond(result);
        }

        std::vector<core::VenuePosition> getOpenPositions() override {
            std::lock_guard<std::mutex> lock(mutex_);
            ++position_queries_;
            if (positions_failures_ > 0) {
                --positions_failures_;
                throw core::TimeoutException("positions endpoint timed out");
            }
            if (positions_auth_failure_) {
                throw core::AuthenticationException("token expired");
            }
            std::vector<core::VenuePosition> out;
            for (const auto& pair : venue_) out.push_back(pair.second);
            return out;
        }

        void script(execution::OrderResult result) {
            std::lock_guard<std::mutex> lock(mutex_);
            scripted_.push_back(std::move(result));
        }
        // The next n responses time out even though the venue acted on the order
        void loseResponses(int n) {
            std::lock_guard<std::mutex> lock(mutex_);
            lost_responses_ = n;
        }
        // The next new order fills at most quantity
        void partialFillNext(long long quantity) {
            std::lock_guard<std::mutex> lock(mutex_);
            partial_fills_.push_back(quantity);
        }
        // The next placeOrder call throws outside the OrderResult contract
        void throwOnNextOrder(std::string message) {
            std::lock_guard<std::mutex> lock(mutex_);
            throw_next_ = std::move(message);
        }
        long long venueNet(const std::string& key) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = venue_.find(key);
            return it == venue_.end() ? 0 : it->second.net_quantity;
        }
        std::set<std::string> clientOrderIds() const {
            std::lock_guard<std::mutex> lock(mutex_);
            std::set<std::string> ids;
            for (const auto& r : requests_) ids.insert(r.client_order_id);
            return ids;
        }
        void setVenuePosition(const std::string& key, long long net_quantity, double average_price) {
            std::lock_guard<std::mutex> lock(mutex_);
            venue_[key] = core::VenuePosition{key, net_quantity, average_price};
        }
        void clearVenue() {
            std::lock_guard<std::mutex> lock(mutex_);
            venue_.clear();
        }
        void failPositionQueries(int times) {
            std::lock_guard<std::mutex> lock(mutex_);
            positions_failures_ = times;
        }
        void setPositionsAuthFailure(bool fail) {
            std::lock_guard<std::mutex> lock(mutex_);
            positions_auth_failure_ = fail;
        }
        // Runs inside placeOrder before the fill, without the gateway lock
        void setBeforeFill(std::function<void(const execution::OrderRequest&)> hook) {
            std::lock_guard<std::mutex> lock(mutex_);
            before_fill_ = std::move(hook);
        }

        std::vector<execution::OrderRequest> requests() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }
        std::size_t requestCount() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_.size();
        }
        int positionQueries() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return position_queries_;
        }

    private:
        // Caller holds mutex_
        execution::OrderResult respond(const execution::OrderResult& result) {
            if (lost_responses_ > 0) {
                --lost_responses_;
                return execution::OrderResult::failed(execution::OrderErrorKind::Timeout, "response lost");
            }
            return result;
        }

        mutable std::mutex mutex_;
        std::deque<execution::OrderResult> scripted_;
        std::map<std::string, execution::OrderResult> executed_;
        std::deque<long long> partial_fills_;
        std::string throw_next_;
        int lost_responses_ = 0;
        std::vector<execution::OrderRequest> requests_;
        std::map<std::string, core::VenuePosition> venue_;
        std::function<void(const execution::OrderRequest&)> before_fill_;
        int positions_failures_ = 0;
        bool positions_auth_failure_ = false;
        int position_queries_ = 0;
    };

    // --- Feed ---
    class FakeMarketFeed : public market_data::MarketFeed {
    public:
        void connect() override {
            std::lock_guard<std::mutex> lock(mutex_);
            ++connect_calls_;
            if (connect_failures_ > 0) {
                --connect_failures_;
                throw core::DisconnectedException("connect refused");
            }
            connected_ = true;
        }
        void subscribe(const std::vector<std::string>& instrument_keys) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!connected_) throw core::DisconnectedException("not connected");
            subscribe_calls_.push_back(instrument_keys);
        }
        bool isConnected() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return connected_;
        }
        void disconnect() override {
            std::lock_guard<std::mutex> lock(mutex_);
            connected_ = false;
        }
        void setTickHandler(market_data::TickHandler handler) override {
            std::lock_guard<std::mutex> lock(mutex_);
            handler_ = std::move(handler);
        }

        void push(const core::Tick& tick) {
            market_data::TickHandler handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                handler = handler_;
            }
            if (handler) handler(tick);
        }
        void failConnects(int times) {
            std::lock_guard<std::mutex> lock(mutex_);
            connect_failures_ = times;
        }
        int connectCalls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return connect_calls_;
        }
        std::vector<std::vector<std::string>> subscribeCalls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return subscribe_calls_;
        }

    private:
        mutable std::mutex mutex_;
        market_data::TickHandler handler_;
        bool connected_ = false;
        int connect_failures_ = 0;
        int connect_calls_ = 0;
        std::vector<std::vector<std::string>> subscribe_calls_;
    };

    // --- Indicators ---
    // Answers compute() with configured constant values or series, aligned to the input length
    class StubIndicatorLibrary : public indicators::IIndicatorLibrary {
    public:
        void set(const std::string& name, double value) {
            std::lock_guard<std::mutex> lock(mutex_);
            constants_[name] = value;
            series_.erase(name);
        }
        // Tail-aligned: the last element maps to the most recent bar
        void setSeries(const std::string& name, std::vector<double> values) {
            std::lock_guard<std::mutex> lock(mutex_);
            series_[name] = std::move(values);
            constants_.erase(name);
        }
        void failOn(const std::string& name) {
            std::lock_guard<std::mutex> lock(mutex_);
            failing_[name] = true;
        }

        core::TimeSeries<double> compute(const core::TimeSeries<core::Candle>& bars,
                                         const std::string& name) const override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failing_.count(name)) {
                throw core::IndicatorCalculationException("stub failure for " + name);
            }
            core::TimeSeries<double> out(bars.size(), std::numeric_limits<double>::quiet_NaN());
            auto c = constants_.find(name);
            if (c != constants_.end()) {
                std::fill(out.begin(), out.end(), c->second);
                return out;
            }
            auto s = series_.find(name);
            if (s != series_.end()) {
                const auto& values = s->second;
                std::size_t n = std::min(values.size(), out.size());
                for (std::size_t i = 0; i < n; ++i) {
                    out[out.size() - n + i] = values[values.size() - n + i];
                }
                return out;
            }
            throw core::IndicatorCalculationException("stub has no value for " + name);
        }

    private:
        mutable std::mutex mutex_;
        std::map<std::string, double> constants_;
        std::map<std::string, std::vector<double>> series_;
        std::map<std::string, bool> failing_;
    };

    // --- Historical data ---
    class FakeHistoricalSource : public data::HistoricalDataSource {
    public:
        core::TimeSeries<core::Candle> fetchCandles(const std::string& instrument_key, const std::string&,
                                                    const std::string&, const std::string&) override {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_;
            if (transient_failures_ > 0) {
                --transient_failures_;
                throw core::TimeoutException("historical endpoint timed out");
            }
            auto it = bars_.find(instrument_key);
            return it == bars_.end() ? core::TimeSeries<core::Candle>{} : it->second;
        }

        void setBars(const std::string& key, core::TimeSeries<core::Candle> bars) {
            std::lock_guard<std::mutex> lock(mutex_);
            bars_[key] = std::move(bars);
        }
        void failTransient(int times) {
            std::lock_guard<std::mutex> lock(mutex_);
            transient_failures_ = times;
        }
        int calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return calls_;
        }

    private:
        mutable std::mutex mutex_;
        std::map<std::string, core::TimeSeries<core::Candle>> bars_;
        int transient_failures_ = 0;
        int calls_ = 0;
    };

    // Retry policy that never sleeps
    inline core::RetryConfig fastRetry(int attempts = 3) {
        core::RetryConfig c;
        c.max_attempts = attempts;
        c.base_delay = std::chrono::milliseconds(0);
        c.max_delay = std::chrono::milliseconds(0);
        c.jitter_fraction = 0.0;
        return c;
    }

} // namespace test_support
