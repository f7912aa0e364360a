#pragma once

#include "exceptions.hpp"
#include "logging.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace core {

    struct RetryConfig {
        int max_attempts = 3;                          // Total attempts including the first
        std::chrono::milliseconds base_delay{500};
        std::chrono::milliseconds max_delay{30000};
        double jitter_fraction = 0.2;                  // +/- fraction applied to each delay
    };

    // Single backoff policy shared by every external-call wrapper.
    // Only TransientException (timeouts, rate limits, disconnects) is retried.
    class RetryPolicy {
    public:
        using Sleeper = std::function<void(std::chrono::milliseconds)>;

        explicit RetryPolicy(RetryConfig config = {}, Sleeper sleeper = {});

        // Capped exponential delay before attempt+1, without jitter. attempt is 1-based.
        std::chrono::milliseconds baseDelayForAttempt(int attempt) const;

        // Same with jitter applied
        std::chrono::milliseconds delayForAttempt(int attempt) const;

        void sleepFor(std::chrono::milliseconds delay) const;

        const RetryConfig& config() const { return config_; }

        template<typename Fn>
        auto execute(const std::string& operation, Fn&& fn) const -> decltype(fn()) {
            for (int attempt = 1; ; ++attempt) {
                try {
                    return fn();
                } catch (const TransientException& e) {
                    if (attempt >= config_.max_attempts) {
                        logging::getLogger()->error("{} failed after {} attempts: {}", operation, attempt, e.what());
                        throw;
                    }
                    auto delay = delayForAttempt(attempt);
                    logging::getLogger()->warn("{} failed (attempt {}/{}): {}. Retrying in {} ms",
                                               operation, attempt, config_.max_attempts, e.what(), delay.count());
                    sleepFor(delay);
                }
            }
        }

    private:
        RetryConfig config_;
        Sleeper sleeper_;
    };

} // namespace core
