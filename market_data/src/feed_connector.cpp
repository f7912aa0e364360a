#include "feed_connector.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <algorithm>

namespace market_data {

    FeedConnector::FeedConnector(MarketFeed& feed, core::RetryPolicy backoff,
                                 std::chrono::milliseconds health_check_interval)
        : feed_(feed), backoff_(std::move(backoff)), health_check_interval_(health_check_interval)
    {
    }

    FeedConnector::~FeedConnector() {
        stop();
    }

    void FeedConnector::setSubscriptions(std::vector<std::string> instrument_keys) {
        std::sort(instrument_keys.begin(), instrument_keys.end());
        instrument_keys.erase(std::unique(instrument_keys.begin(), instrument_keys.end()), instrument_keys.end());
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        subscriptions_ = std::move(instrument_keys);
    }

    std::vector<std::string> FeedConnector::subscriptionReplay() const {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        return subscriptions_;
    }

    bool FeedConnector::connectOnce() {
        auto logger = core::logging::getLogger();
        try {
            feed_.connect();
        } catch (const core::TransientException& e) {
            logger->warn("Market feed connect failed: {}", e.what());
            return false;
        }

        std::vector<std::string> replay = subscriptionReplay();
        try {
            if (!replay.empty()) {
                feed_.subscribe(replay);
            }
        } catch (const core::TransientException& e) {
            // Half-open session: drop it so the next attempt starts clean
            logger->warn("Market feed subscription replay failed: {}", e.what());
            feed_.disconnect();
            return false;
        }
        logger->info("Market feed connected, {} subscriptions replayed", replay.size());
        return true;
    }

    void FeedConnector::start() {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            return;
        }
        supervisor_ = std::thread(&FeedConnector::superviseLoop, this);
    }

    void FeedConnector::stop() {
        bool was_running = running_.exchange(false);
        wait_cv_.notify_all();
        if (supervisor_.joinable()) {
            supervisor_.join();
        }
        if (was_running) {
            feed_.disconnect();
            core::logging::getLogger()->info("Market feed connector stopped");
        }
    }

    bool FeedConnector::isConnected() const {
        return feed_.isConnected();
    }

    bool FeedConnector::waitFor(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, delay, [this]() { return !running_.load(); });
        return running_.load();
    }

    void FeedConnector::superviseLoop() {
        auto logger = core::logging::getLogger();
        int attempt = 0;
        while (running_.load()) {
            if (feed_.isConnected()) {
                attempt = 0;
                if (!waitFor(health_check_interval_)) {
                    break;
                }
                continue;
            }

            ++attempt;
            logger->warn("Market feed disconnected, reconnect attempt {}", attempt);
            bool connected = false;
            try {
                connected = connectOnce();
            } catch (const core::EngineException& e) {
                logger->error("Market feed reconnect error: {}", e.what());
            }
            if (connected) {
                reconnects_.fetch_add(1);
                attempt = 0;
                continue;
            }

            auto delay = backoff_.delayForAttempt(attempt);
            logger->info("Next market feed reconnect in {} ms", delay.count());
            if (!waitFor(delay)) {
                break;
            }
        }
    }

} // namespace market_data
