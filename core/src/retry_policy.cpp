#include "retry_policy.hpp"
#include <algorithm>
#include <random>
#include <thread>

namespace core {

    RetryPolicy::RetryPolicy(RetryConfig config, Sleeper sleeper)
        : config_(config), sleeper_(std::move(sleeper))
    {
        if (config_.max_attempts < 1) {
            throw ConfigException("Retry max_attempts must be at least 1");
        }
        if (config_.base_delay.count() < 0 || config_.max_delay < config_.base_delay) {
            throw ConfigException("Retry delays must satisfy 0 <= base_delay <= max_delay");
        }
        if (config_.jitter_fraction < 0.0 || config_.jitter_fraction >= 1.0) {
            throw ConfigException("Retry jitter_fraction must be in [0, 1)");
        }
    }

    std::chrono::milliseconds RetryPolicy::baseDelayForAttempt(int attempt) const {
        if (attempt < 1) {
            attempt = 1;
        }
        // Saturate the shift well before overflow, the cap takes over anyway
        int exponent = std::min(attempt - 1, 30);
        long long delay = config_.base_delay.count() * (1LL << exponent);
        return std::chrono::milliseconds(std::min(delay, static_cast<long long>(config_.max_delay.count())));
    }

    std::chrono::milliseconds RetryPolicy::delayForAttempt(int attempt) const {
        auto base = baseDelayForAttempt(attempt);
        if (config_.jitter_fraction <= 0.0 || base.count() == 0) {
            return base;
        }
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(-config_.jitter_fraction, config_.jitter_fraction);
        double jittered = static_cast<double>(base.count()) * (1.0 + dist(rng));
        return std::chrono::milliseconds(static_cast<long long>(std::max(0.0, jittered)));
    }

    void RetryPolicy::sleepFor(std::chrono::milliseconds delay) const {
        if (sleeper_) {
            sleeper_(delay);
        } else {
            std::this_thread::sleep_for(delay);
        }
    }

} // namespace core
