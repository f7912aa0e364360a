#pragma once

#include "audit_event.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>

namespace audit {

    // Bounded queue in front of an IAuditSink. publish() only enqueues; a
    // background thread drains batches into the sink. When the queue is full
    // the new event is dropped and counted.
    class AsyncAuditDispatcher : public IAuditPublisher {
    public:
        AsyncAuditDispatcher(IAuditSink& sink, std::size_t capacity, std::size_t batch_size,
                             std::chrono::milliseconds flush_interval);
        ~AsyncAuditDispatcher() override;

        AsyncAuditDispatcher(const AsyncAuditDispatcher&) = delete;
        AsyncAuditDispatcher& operator=(const AsyncAuditDispatcher&) = delete;

        bool publish(AuditEvent event) override;

        void start();
        // Drains whatever is queued, then joins the writer thread
        void stop();

        std::uint64_t droppedCount() const { return dropped_.load(); }
        std::uint64_t writtenCount() const { return written_.load(); }
        std::uint64_t failedBatchCount() const { return failed_batches_.load(); }
        std::size_t pending() const;

    private:
        void drainLoop();
        void writeBatch(std::vector<AuditEvent>& batch);

        IAuditSink& sink_;
        const std::size_t capacity_;
        const std::size_t batch_size_;
        const std::chrono::milliseconds flush_interval_;

        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<AuditEvent> queue_;
        bool running_ = false;

        std::atomic<std::uint64_t> dropped_{0};
        std::atomic<std::uint64_t> written_{0};
        std::atomic<std::uint64_t> failed_batches_{0};
        std::thread writer_;
    };

} // namespace audit
