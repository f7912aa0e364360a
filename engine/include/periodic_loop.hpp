#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace engine {

    // One named thread running a task at a fixed rate. Waits are timed
    // condition-variable waits, so stop() interrupts the sleep at once and
    // only ever waits for the iteration in progress.
    class PeriodicLoop {
    public:
        using Task = std::function<void()>;

        PeriodicLoop(std::string name, std::chrono::milliseconds interval, Task task);
        ~PeriodicLoop();

        PeriodicLoop(const PeriodicLoop&) = delete;
        PeriodicLoop& operator=(const PeriodicLoop&) = delete;

        void start();
        void stop();

        // Pushes the next iteration back by extra (used for error backoff). Callable from the task.
        void delayNext(std::chrono::milliseconds extra);

        bool isRunning() const { return running_.load(); }
        std::uint64_t cycleCount() const { return cycles_.load(); }
        std::uint64_t errorCount() const { return errors_.load(); }
        const std::string& name() const { return name_; }
        std::chrono::milliseconds interval() const { return interval_; }

    private:
        void run();

        const std::string name_;
        const std::chrono::milliseconds interval_;
        Task task_;

        std::mutex mutex_;
        std::condition_variable cv_;
        std::chrono::milliseconds extra_delay_{0};
        std::atomic<bool> running_{false};
        std::atomic<std::uint64_t> cycles_{0};
        std::atomic<std::uint64_t> errors_{0};
        std::thread thread_;
    };

} // namespace engine
