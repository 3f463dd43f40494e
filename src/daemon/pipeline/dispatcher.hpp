#pragma once

#include <functional>

// Marshals work onto the thread that owns clipboard and other desktop
// interactions (the daemon's main loop).
class MainThreadDispatcher {
public:
    using Task = std::function<void()>;

    virtual ~MainThreadDispatcher() = default;

    // Runs task on the main thread and waits for it. Exceptions thrown by the
    // task are rethrown in the caller.
    virtual void invoke(Task task) = 0;

    // Queues task without waiting.
    virtual void post(Task task) = 0;
};
