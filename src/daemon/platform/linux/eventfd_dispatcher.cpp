#include "platform/linux/eventfd_dispatcher.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <exception>
#include <future>
#include <memory>
#include <print>
#include <sys/eventfd.h>
#include <unistd.h>

EventFdDispatcher::EventFdDispatcher() : owner_(std::this_thread::get_id()) {}

EventFdDispatcher::~EventFdDispatcher() {
    if (event_fd_ >= 0) ::close(event_fd_);
}

bool EventFdDispatcher::init() {
    event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (event_fd_ < 0) {
        std::println(stderr, "[holdtalk] eventfd failed: {}", std::strerror(errno));
        return false;
    }
    owner_ = std::this_thread::get_id();
    return true;
}

void EventFdDispatcher::invoke(Task task) {
    bool inline_run;
    {
        std::lock_guard lock(mutex_);
        inline_run = closed_ || std::this_thread::get_id() == owner_;
    }
    if (inline_run) {
        task();
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto finished = done->get_future();
    post([task = std::move(task), done] {
        try {
            task();
            done->set_value();
        } catch (...) {
            done->set_exception(std::current_exception());
        }
    });
    finished.get();
}

void EventFdDispatcher::post(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (!closed_) {
            queue_.push_back(std::move(task));
            wake();
            return;
        }
    }
    task();
}

void EventFdDispatcher::run_pending() {
    uint64_t val;
    while (::read(event_fd_, &val, sizeof(val)) < 0 && errno == EINTR) {}

    std::deque<Task> tasks;
    {
        std::lock_guard lock(mutex_);
        tasks.swap(queue_);
    }
    for (auto& t : tasks) {
        try {
            t();
        } catch (const std::exception& e) {
            std::println(stderr, "[holdtalk] main-thread task failed: {}", e.what());
        }
    }
}

void EventFdDispatcher::close() {
    std::deque<Task> tasks;
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        tasks.swap(queue_);
    }
    for (auto& t : tasks) t();
}

void EventFdDispatcher::wake() {
    if (event_fd_ < 0) return;
    uint64_t one = 1;
    ssize_t n = ::write(event_fd_, &one, sizeof(one));
    (void)n; // counter saturation only delays the wakeup already pending
}
