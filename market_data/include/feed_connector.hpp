#pragma once

#include "market_feed.hpp"
#include "retry_policy.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace market_data {

    // Keeps a MarketFeed connected while the engine runs.
    // Reconnects use capped exponential backoff with jitter and never give up;
    // after every successful connect the full subscription set is replayed in
    // sorted order before the connector reports healthy again.
    class FeedConnector {
    public:
        FeedConnector(MarketFeed& feed, core::RetryPolicy backoff,
                      std::chrono::milliseconds health_check_interval);
        ~FeedConnector();

        FeedConnector(const FeedConnector&) = delete;
        FeedConnector& operator=(const FeedConnector&) = delete;

        void setSubscriptions(std::vector<std::string> instrument_keys);

        // Deterministic order in which subscriptions are sent
        std::vector<std::string> subscriptionReplay() const;

        // One connect + subscribe attempt. Returns false on a transient failure.
        bool connectOnce();

        // Starts the supervising thread (reconnects whenever the feed drops)
        void start();
        // Stops supervising and disconnects the feed
        void stop();

        bool isConnected() const;
        std::uint64_t reconnectCount() const { return reconnects_.load(); }

    private:
        void superviseLoop();
        bool waitFor(std::chrono::milliseconds delay); // false when stopping

        MarketFeed& feed_;
        core::RetryPolicy backoff_;
        const std::chrono::milliseconds health_check_interval_;

        mutable std::mutex subscriptions_mutex_;
        std::vector<std::string> subscriptions_;

        std::mutex wait_mutex_;
        std::condition_variable wait_cv_;
        std::atomic<bool> running_{false};
        std::atomic<std::uint64_t> reconnects_{0};
        std::thread supervisor_;
    };

} // namespace market_data
