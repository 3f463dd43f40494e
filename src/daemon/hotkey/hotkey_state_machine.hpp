#pragma once

#include "hotkey/keys.hpp"
#include "log.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

enum class TransmissionMode {
    None,
    Plain,           // Trigger-1, hold
    Prompt,          // Shift + Trigger-2, hold
    CopyPrompt,      // Ctrl + Trigger-2, hold
    VisionHold,      // Ctrl + Trigger-3, hold
    VisionImmediate, // Shift + Trigger-3, fire once
    TtsImmediate,    // Ctrl + Trigger-1, fire once (debounced)
};

const char* to_string(TransmissionMode mode);

// Hold modes produce a Started/Ended pair; immediate modes a single event.
constexpr bool is_hold_mode(TransmissionMode mode) {
    return mode == TransmissionMode::Plain || mode == TransmissionMode::Prompt ||
           mode == TransmissionMode::CopyPrompt || mode == TransmissionMode::VisionHold;
}

enum class HotkeyEventKind {
    TransmissionStarted,
    TransmissionEnded,
    TtsTriggered,
    VisionCaptureStarted,
};

struct HotkeyEvent {
    HotkeyEventKind kind;
    TransmissionMode mode;
    std::chrono::steady_clock::time_point at;
};

struct HotkeyBindings {
    KeyId trigger1 = keys::F1;
    KeyId trigger2 = keys::F2;
    KeyId trigger3 = keys::F3;
};

// Turns raw key-down/key-up notifications into transmission events.
//
// Key handlers run on the listener thread. Start/stop decisions are made under
// a single mutex; subscribers are notified after it is released, synchronously
// and in registration order.
class HotkeyStateMachine {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Listener = std::function<void(const HotkeyEvent&)>;

    static constexpr std::chrono::milliseconds kDefaultDebounce{200};

    HotkeyStateMachine(HotkeyBindings bindings, Logger& log,
                       std::chrono::milliseconds tts_debounce = kDefaultDebounce,
                       Clock clock = {});

    HotkeyStateMachine(const HotkeyStateMachine&) = delete;
    HotkeyStateMachine& operator=(const HotkeyStateMachine&) = delete;

    size_t subscribe(Listener listener);

    // Both return true when the event must not reach other applications.
    bool on_key_down(KeyId key);
    bool on_key_up(KeyId key);

    // Drops any active transmission without emitting an Ended event. Used when
    // the listener dies mid-hold and the matching release will never arrive.
    std::optional<TransmissionMode> abandon();

    void set_bindings(HotkeyBindings bindings);
    void set_tts_debounce(std::chrono::milliseconds window);

    TransmissionMode active_mode() const;
    bool is_transmitting() const { return active_mode() != TransmissionMode::None; }
    bool modifier_held(keys::Modifier mod) const;

private:
    struct Active {
        TransmissionMode mode;
        KeyId key;
    };

    // Called with mutex_ held.
    bool held_locked(keys::Modifier mod) const;
    bool try_start_locked(TransmissionMode mode, KeyId key);
    bool release_matches_locked(KeyId key) const;

    void emit(HotkeyEventKind kind, TransmissionMode mode);

    Logger& log_;
    Clock clock_;

    mutable std::mutex mutex_;
    HotkeyBindings bindings_;
    std::chrono::milliseconds tts_debounce_;
    std::set<KeyId> modifiers_;
    std::optional<Active> active_;
    std::set<KeyId> suppressed_downs_; // so the matching key-up is swallowed too
    std::optional<std::chrono::steady_clock::time_point> last_tts_;

    std::mutex listeners_mutex_;
    std::vector<Listener> listeners_;
};
