#include "order_worker.hpp"
#include "logging.hpp"
#include <exception>

namespace execution {

OrderWorker::OrderWorker(std::string name) : name_(std::move(name)) {}

OrderWorker::~OrderWorker() {
    stop();
}

void OrderWorker::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&OrderWorker::run, this);
    core::logging::getLogger()->debug("OrderWorker '{}' started.", name_);
}

void OrderWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    core::logging::getLogger()->debug("OrderWorker '{}' stopped after {} jobs.", name_, completed_.load());
}

bool OrderWorker::post(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            core::logging::getLogger()->warn("OrderWorker '{}' is not running, job rejected.", name_);
            return false;
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void OrderWorker::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return jobs_.empty() && !busy_; });
}

std::size_t OrderWorker::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

bool OrderWorker::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void OrderWorker::run() {
    auto logger = core::logging::getLogger();
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this]() { return !jobs_.empty() || !running_; });
        if (jobs_.empty()) {
            break; // Stopping and drained
        }
        Job job = std::move(jobs_.front());
        jobs_.pop_front();
        busy_ = true;
        lock.unlock();

        try {
            job();
        } catch (const std::exception& e) {
            logger->error("OrderWorker '{}': job failed: {}", name_, e.what());
        }
        ++completed_;

        lock.lock();
        busy_ = false;
        if (jobs_.empty()) {
            idle_cv_.notify_all();
        }
    }
    idle_cv_.notify_all();
}

} // namespace execution
