#pragma once

#include "log.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Unordered background pool for pipeline stages that must stay off the
// key-event thread.
class WorkPool {
public:
    using Job = std::function<void()>;

    WorkPool(size_t workers, Logger& log);
    ~WorkPool();

    WorkPool(const WorkPool&) = delete;
    WorkPool& operator=(const WorkPool&) = delete;

    // False once shutdown() has begun.
    bool submit(Job job);

    // Runs everything already queued, then joins the workers.
    void shutdown();

    size_t pending() const;

private:
    void worker_loop();

    Logger& log_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> queue_;
    bool stopping_ = false;

    std::vector<std::jthread> workers_;
};
