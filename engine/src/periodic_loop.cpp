#include "periodic_loop.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

namespace engine {

PeriodicLoop::PeriodicLoop(std::string name, std::chrono::milliseconds interval, Task task)
    : name_(std::move(name)), interval_(interval), task_(std::move(task))
{
    if (interval_.count() <= 0) {
        throw core::ConfigException("PeriodicLoop '" + name_ + "' needs a positive interval.");
    }
    if (!task_) {
        throw core::ConfigException("PeriodicLoop '" + name_ + "' has no task.");
    }
}

PeriodicLoop::~PeriodicLoop() {
    stop();
}

void PeriodicLoop::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&PeriodicLoop::run, this);
    core::logging::getLogger()->info("Loop '{}' started (every {} ms).", name_, interval_.count());
}

void PeriodicLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) return;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    core::logging::getLogger()->info("Loop '{}' stopped after {} cycles ({} errors).", name_, cycles_.load(), errors_.load());
}

void PeriodicLoop::delayNext(std::chrono::milliseconds extra) {
    std::lock_guard<std::mutex> lock(mutex_);
    extra_delay_ = extra;
}

void PeriodicLoop::run() {
    auto logger = core::logging::getLogger();
    auto next = std::chrono::steady_clock::now();

    while (running_.load()) {
        try {
            task_();
        } catch (const std::exception& e) {
            ++errors_;
            logger->error("Loop '{}' iteration failed: {}", name_, e.what());
        }
        ++cycles_;

        std::unique_lock<std::mutex> lock(mutex_);
        next += interval_ + extra_delay_;
        extra_delay_ = std::chrono::milliseconds(0);
        auto now = std::chrono::steady_clock::now();
        if (next < now) {
            // Overran: skip the missed ticks instead of bursting
            next = now + interval_;
        }
        cv_.wait_until(lock, next, [this]() { return !running_.load(); });
    }
}

} // namespace engine
