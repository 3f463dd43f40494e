#pragma once

#include "hotkey/hotkey_state_machine.hpp"
#include "log.hpp"
#include "platform/key_event_source.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

enum class ListenerState { Stopped, Running, Restarting, Failed };

const char* to_string(ListenerState state);

// Keeps the key listener alive: restarts it after abnormal termination with a
// linear backoff (base x attempt) until the retry budget is spent.
class ListenerSupervisor {
public:
    struct Policy {
        std::chrono::milliseconds base_delay{1000};
        uint32_t max_restarts = 3;
        // A run lasting this long counts as healthy and resets the attempt counter.
        std::chrono::milliseconds stable_after{30000};
    };

    using FatalCallback = std::function<void(const std::string& reason)>;
    // Called on the listener thread with the mode of a hold whose release was lost.
    using OrphanCallback = std::function<void(TransmissionMode mode)>;
    // Returns false if the wait was interrupted by stop().
    using Sleeper = std::function<bool(std::chrono::milliseconds)>;

    ListenerSupervisor(KeyEventSource& source, HotkeyStateMachine& machine,
                       Logger& log, Policy policy, Sleeper sleeper = {});
    ~ListenerSupervisor();

    ListenerSupervisor(const ListenerSupervisor&) = delete;
    ListenerSupervisor& operator=(const ListenerSupervisor&) = delete;

    void on_fatal(FatalCallback cb) { on_fatal_ = std::move(cb); }
    void on_orphan(OrphanCallback cb) { on_orphan_ = std::move(cb); }

    // Takes effect at the next failure; the current attempt count is kept.
    void set_policy(Policy policy);
    Policy policy() const;

    // Spawns the listener thread.
    void start();
    // Runs the supervise loop on the calling thread until stopped or failed.
    void run();
    void stop();

    ListenerState state() const { return state_.load(std::memory_order_acquire); }

private:
    bool interruptible_sleep(std::chrono::milliseconds delay);

    KeyEventSource& source_;
    HotkeyStateMachine& machine_;
    Logger& log_;
    mutable std::mutex policy_mutex_;
    Policy policy_;
    Sleeper sleeper_;
    FatalCallback on_fatal_;
    OrphanCallback on_orphan_;

    std::atomic<ListenerState> state_{ListenerState::Stopped};
    std::atomic<bool> stop_requested_{false};

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    std::jthread thread_;
};
