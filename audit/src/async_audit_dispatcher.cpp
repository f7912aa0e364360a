#include "async_audit_dispatcher.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

namespace audit {

    AsyncAuditDispatcher::AsyncAuditDispatcher(IAuditSink& sink, std::size_t capacity, std::size_t batch_size,
                                               std::chrono::milliseconds flush_interval)
        : sink_(sink), capacity_(capacity), batch_size_(batch_size), flush_interval_(flush_interval)
    {
        if (capacity_ == 0 || batch_size_ == 0) {
            throw core::ConfigException("Audit dispatcher requires positive capacity and batch size");
        }
    }

    AsyncAuditDispatcher::~AsyncAuditDispatcher() {
        stop();
    }

    bool AsyncAuditDispatcher::publish(AuditEvent event) {
        bool batch_ready = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.size() >= capacity_) {
                std::uint64_t dropped = dropped_.fetch_add(1) + 1;
                // Log the first drop and then every thousandth to avoid flooding
                if (dropped == 1 || dropped % 1000 == 0) {
                    core::logging::getLogger()->warn("Audit queue full ({} events), {} events dropped so far",
                                                     capacity_, dropped);
                }
                return false;
            }
            queue_.push_back(std::move(event));
            batch_ready = queue_.size() >= batch_size_;
        }
        if (batch_ready) {
            cv_.notify_one();
        }
        return true;
    }

    void AsyncAuditDispatcher::start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
        writer_ = std::thread(&AsyncAuditDispatcher::drainLoop, this);
    }

    void AsyncAuditDispatcher::stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return;
            }
            running_ = false;
        }
        cv_.notify_all();
        if (writer_.joinable()) {
            writer_.join();
        }
        core::logging::getLogger()->info("Audit dispatcher stopped: {} written, {} dropped, {} failed batches",
                                         written_.load(), dropped_.load(), failed_batches_.load());
    }

    std::size_t AsyncAuditDispatcher::pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    void AsyncAuditDispatcher::drainLoop() {
        std::vector<AuditEvent> batch;
        batch.reserve(batch_size_);
        while (true) {
            bool keep_running = true;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, flush_interval_, [this]() {
                    return !running_ || queue_.size() >= batch_size_;
                });
                keep_running = running_;
                while (!queue_.empty() && batch.size() < batch_size_) {
                    batch.push_back(std::move(queue_.front()));
                    queue_.pop_front();
                }
                // Final pass: take everything that is left
                if (!keep_running) {
                    while (!queue_.empty()) {
                        batch.push_back(std::move(queue_.front()));
                        queue_.pop_front();
                    }
                }
            }
            if (!batch.empty()) {
                writeBatch(batch);
            }
            if (!keep_running) {
                break;
            }
        }
    }

    void AsyncAuditDispatcher::writeBatch(std::vector<AuditEvent>& batch) {
        bool ok = false;
        try {
            ok = sink_.write(batch);
        } catch (const std::exception& e) {
            core::logging::getLogger()->error("Audit sink threw while writing {} events: {}", batch.size(), e.what());
        }
        if (ok) {
            written_.fetch_add(batch.size());
        } else {
            failed_batches_.fetch_add(1);
            core::logging::getLogger()->error("Audit sink rejected a batch of {} events", batch.size());
        }
        batch.clear();
    }

} // namespace audit
