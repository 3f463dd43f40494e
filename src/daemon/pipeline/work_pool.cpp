#include "pipeline/work_pool.hpp"

#include <exception>

WorkPool::WorkPool(size_t workers, Logger& log) : log_(log) {
    if (workers == 0) workers = 1;
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkPool::~WorkPool() {
    shutdown();
}

bool WorkPool::submit(Job job) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return false;
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void WorkPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    workers_.clear();
}

size_t WorkPool::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void WorkPool::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return; // stopping and drained
            job = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            job();
        } catch (const std::exception& e) {
            log_.error("pool: job threw: {}", e.what());
        }
    }
}
