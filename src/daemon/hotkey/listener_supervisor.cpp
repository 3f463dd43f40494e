#include "hotkey/listener_supervisor.hpp"

const char* to_string(ListenerState state) {
    switch (state) {
        case ListenerState::Stopped: return "stopped";
        case ListenerState::Running: return "running";
        case ListenerState::Restarting: return "restarting";
        case ListenerState::Failed: return "failed";
    }
    return "unknown";
}

ListenerSupervisor::ListenerSupervisor(KeyEventSource& source, HotkeyStateMachine& machine,
                                       Logger& log, Policy policy, Sleeper sleeper)
    : source_(source), machine_(machine), log_(log), policy_(policy),
      sleeper_(std::move(sleeper)) {
    source_.set_handlers(
        [this](KeyId key) { return machine_.on_key_down(key); },
        [this](KeyId key) { return machine_.on_key_up(key); });
}

ListenerSupervisor::~ListenerSupervisor() {
    stop();
}

void ListenerSupervisor::start() {
    if (thread_.joinable()) return;
    stop_requested_.store(false, std::memory_order_release);
    thread_ = std::jthread([this] { run(); });
}

void ListenerSupervisor::run() {
    uint32_t attempt = 0;

    while (!stop_requested_.load(std::memory_order_acquire)) {
        state_.store(ListenerState::Running, std::memory_order_release);
        auto started = std::chrono::steady_clock::now();

        auto result = source_.run();
        if (result || stop_requested_.load(std::memory_order_acquire)) break;

        log_.error("hotkey: listener failed: {}", result.error());

        if (auto orphan = machine_.abandon()) {
            log_.warn("hotkey: {} transmission orphaned by listener failure, its release will not be seen",
                      to_string(*orphan));
            if (on_orphan_) on_orphan_(*orphan);
        }

        auto policy = this->policy();
        if (std::chrono::steady_clock::now() - started >= policy.stable_after) {
            attempt = 0;
        }

        if (attempt >= policy.max_restarts) {
            state_.store(ListenerState::Failed, std::memory_order_release);
            log_.critical("hotkey: listener restart limit ({}) exceeded, hotkeys disabled until restart",
                          policy.max_restarts);
            if (on_fatal_) on_fatal_(result.error());
            return;
        }

        ++attempt;
        auto delay = policy.base_delay * attempt;
        state_.store(ListenerState::Restarting, std::memory_order_release);
        log_.info("hotkey: restarting listener in {}ms (attempt {}/{})",
                  delay.count(), attempt, policy.max_restarts);

        bool slept = sleeper_ ? sleeper_(delay) : interruptible_sleep(delay);
        if (!slept) break;
    }

    state_.store(ListenerState::Stopped, std::memory_order_release);
}

void ListenerSupervisor::set_policy(Policy policy) {
    std::lock_guard lock(policy_mutex_);
    policy_ = policy;
}

ListenerSupervisor::Policy ListenerSupervisor::policy() const {
    std::lock_guard lock(policy_mutex_);
    return policy_;
}

void ListenerSupervisor::stop() {
    {
        std::lock_guard lock(wait_mutex_);
        stop_requested_.store(true, std::memory_order_release);
    }
    wait_cv_.notify_all();
    source_.stop();

    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

bool ListenerSupervisor::interruptible_sleep(std::chrono::milliseconds delay) {
    std::unique_lock lock(wait_mutex_);
    return !wait_cv_.wait_for(lock, delay, [this] {
        return stop_requested_.load(std::memory_order_acquire);
    });
}
