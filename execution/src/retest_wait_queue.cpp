#include "retest_wait_queue.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cmath>

namespace execution {

RetestWaitQueue::RetestWaitQueue(std::chrono::minutes timeout, double tolerance_pct)
    : timeout_(timeout), tolerance_pct_(tolerance_pct)
{
    if (timeout_.count() <= 0 || tolerance_pct_ <= 0.0) {
        throw core::ConfigException("Retest timeout and tolerance must be positive.");
    }
}

bool RetestWaitQueue::enqueue(const core::Signal& signal, long long quantity, core::Timestamp now) {
    auto logger = core::logging::getLogger();
    core::PendingRetest retest;
    retest.instrument_key = signal.instrument_key;
    retest.direction = signal.direction;
    retest.breakout_price = signal.entry_price;
    retest.stop_loss = signal.stop_loss;
    retest.target = signal.target;
    retest.quantity = quantity;
    retest.strategy_id = signal.strategy_id;
    retest.created_at = now;
    retest.deadline = now + timeout_;

    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.count(retest.instrument_key) > 0) {
        logger->debug("Retest already pending for {}, new breakout ignored.", retest.instrument_key);
        return false;
    }
    logger->info("Retest queued: {} {} level {:.2f} SL {:.2f} x{} until {}", retest.instrument_key,
                 core::directionToString(retest.direction), retest.breakout_price, retest.stop_loss,
                 retest.quantity, core::utils::timestampToString(retest.deadline));
    pending_.emplace(retest.instrument_key, retest);
    return true;
}

bool RetestWaitQueue::isTouch(const core::PendingRetest& retest, double price) const {
    return std::abs(price - retest.breakout_price) <= tolerance_pct_ * retest.breakout_price;
}

bool RetestWaitQueue::isBeyondBand(const core::PendingRetest& retest, double price) const {
    double band = tolerance_pct_ * retest.breakout_price;
    return retest.direction == core::Direction::Long ? price > retest.breakout_price + band
                                                     : price < retest.breakout_price - band;
}

RetestEvaluation RetestWaitQueue::evaluate(const std::map<std::string, double>& prices, core::Timestamp now) {
    auto logger = core::logging::getLogger();
    RetestEvaluation result;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = pending_.begin(); it != pending_.end();) {
        core::PendingRetest& retest = it->second;

        // Expiry first: nothing is ordered after the deadline
        if (now > retest.deadline) {
            logger->info("Retest expired: {} level {:.2f}, no pullback by {}", retest.instrument_key,
                         retest.breakout_price, core::utils::timestampToString(retest.deadline));
            result.expired.push_back(retest);
            it = pending_.erase(it);
            continue;
        }

        auto price_it = prices.find(retest.instrument_key);
        if (price_it == prices.end()) {
            ++it;
            continue;
        }
        double price = price_it->second;

        bool through_stop = retest.direction == core::Direction::Long ? price <= retest.stop_loss
                                                                      : price >= retest.stop_loss;
        if (through_stop) {
            logger->info("Retest invalidated: {} traded {:.2f} through stop {:.2f}", retest.instrument_key, price, retest.stop_loss);
            result.invalidated.push_back(retest);
            it = pending_.erase(it);
            continue;
        }

        // A pullback needs the price to have left the band first
        if (!retest.departed) {
            if (isBeyondBand(retest, price)) {
                retest.departed = true;
                logger->debug("Retest {}: {:.2f} left the band around {:.2f}, waiting for the pullback.",
                              retest.instrument_key, price, retest.breakout_price);
            }
            ++it;
            continue;
        }

        if (isTouch(retest, price)) {
            logger->info("Retest filled: {} touched {:.2f} (level {:.2f})", retest.instrument_key, price, retest.breakout_price);
            result.filled.push_back(RetestFill{retest, price});
            it = pending_.erase(it);
            continue;
        }
        ++it;
    }
    return result;
}

bool RetestWaitQueue::has(const std::string& instrument_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(instrument_key) > 0;
}

std::optional<core::PendingRetest> RetestWaitQueue::get(const std::string& instrument_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(instrument_key);
    if (it == pending_.end()) return std::nullopt;
    return it->second;
}

std::vector<core::PendingRetest> RetestWaitQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::PendingRetest> result;
    for (const auto& pair : pending_) result.push_back(pair.second);
    return result;
}

std::size_t RetestWaitQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::vector<core::PendingRetest> RetestWaitQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::PendingRetest> dropped;
    for (const auto& pair : pending_) dropped.push_back(pair.second);
    pending_.clear();
    return dropped;
}

} // namespace execution
