#pragma once

#include "pipeline/dispatcher.hpp"

#include <deque>
#include <mutex>
#include <thread>

// Hands tasks to the epoll loop thread. The loop watches fd() and calls
// run_pending() when it becomes readable.
class EventFdDispatcher : public MainThreadDispatcher {
public:
    EventFdDispatcher();
    ~EventFdDispatcher() override;

    EventFdDispatcher(const EventFdDispatcher&) = delete;
    EventFdDispatcher& operator=(const EventFdDispatcher&) = delete;

    bool init();
    int fd() const { return event_fd_; }

    void invoke(Task task) override;
    void post(Task task) override;

    // Loop thread only.
    void run_pending();

    // Runs what is queued and switches to running tasks on the caller's
    // thread, so workers finishing during shutdown cannot block on a loop
    // that no longer runs.
    void close();

private:
    void wake();

    int event_fd_ = -1;
    std::thread::id owner_;

    std::mutex mutex_;
    std::deque<Task> queue_;
    bool closed_ = false;
};
