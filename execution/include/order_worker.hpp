#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace execution {

    // Single background thread running order jobs in submission order, so that
    // the caller (monitor loop) never waits on the network. stop() finishes
    // every job already submitted before joining.
    class OrderWorker {
    public:
        using Job = std::function<void()>;

        explicit OrderWorker(std::string name);
        ~OrderWorker();

        OrderWorker(const OrderWorker&) = delete;
        OrderWorker& operator=(const OrderWorker&) = delete;

        void start();
        void stop();

        // False once stopping, the job is then not run
        bool post(Job job);

        // Blocks until the queue is empty and no job is running
        void waitIdle();

        std::size_t pending() const;
        std::uint64_t completedCount() const { return completed_.load(); }
        bool isRunning() const;

    private:
        void run();

        const std::string name_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::condition_variable idle_cv_;
        std::deque<Job> jobs_;
        bool running_ = false;
        bool busy_ = false;
        std::atomic<std::uint64_t> completed_{0};
        std::thread thread_;
    };

} // namespace execution
