#include "hotkey/hotkey_state_machine.hpp"

const char* to_string(TransmissionMode mode) {
    switch (mode) {
        case TransmissionMode::None: return "none";
        case TransmissionMode::Plain: return "plain";
        case TransmissionMode::Prompt: return "prompt";
        case TransmissionMode::CopyPrompt: return "copy-prompt";
        case TransmissionMode::VisionHold: return "vision-hold";
        case TransmissionMode::VisionImmediate: return "vision-immediate";
        case TransmissionMode::TtsImmediate: return "tts";
    }
    return "unknown";
}

HotkeyStateMachine::HotkeyStateMachine(HotkeyBindings bindings, Logger& log,
                                       std::chrono::milliseconds tts_debounce,
                                       Clock clock)
    : log_(log),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })),
      bindings_(bindings), tts_debounce_(tts_debounce) {}

size_t HotkeyStateMachine::subscribe(Listener listener) {
    std::lock_guard lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
    return listeners_.size() - 1;
}

bool HotkeyStateMachine::on_key_down(KeyId key) {
    std::optional<HotkeyEventKind> kind;
    TransmissionMode mode = TransmissionMode::None;

    {
        std::lock_guard lock(mutex_);

        if (keys::is_modifier(key)) {
            modifiers_.insert(key);
            return false;
        }

        const auto& b = bindings_;
        if (key == b.trigger1 && held_locked(keys::Modifier::Control)) {
            auto now = clock_();
            if (last_tts_ && now - *last_tts_ < tts_debounce_) {
                log_.debug("hotkey: tts trigger within debounce window, dropped");
                suppressed_downs_.insert(key);
                return true;
            }
            last_tts_ = now;
            kind = HotkeyEventKind::TtsTriggered;
            mode = TransmissionMode::TtsImmediate;
        } else if (key == b.trigger1) {
            if (try_start_locked(TransmissionMode::Plain, key)) {
                kind = HotkeyEventKind::TransmissionStarted;
                mode = TransmissionMode::Plain;
            }
        } else if (key == b.trigger2 && held_locked(keys::Modifier::Shift)) {
            if (try_start_locked(TransmissionMode::Prompt, key)) {
                kind = HotkeyEventKind::TransmissionStarted;
                mode = TransmissionMode::Prompt;
            }
        } else if (key == b.trigger2 && held_locked(keys::Modifier::Control)) {
            if (try_start_locked(TransmissionMode::CopyPrompt, key)) {
                kind = HotkeyEventKind::TransmissionStarted;
                mode = TransmissionMode::CopyPrompt;
            }
        } else if (key == b.trigger3 && held_locked(keys::Modifier::Shift)) {
            kind = HotkeyEventKind::VisionCaptureStarted;
            mode = TransmissionMode::VisionImmediate;
        } else if (key == b.trigger3 && held_locked(keys::Modifier::Control)) {
            if (try_start_locked(TransmissionMode::VisionHold, key)) {
                kind = HotkeyEventKind::TransmissionStarted;
                mode = TransmissionMode::VisionHold;
            }
        } else {
            return false;
        }

        suppressed_downs_.insert(key);
    }

    if (kind) {
        log_.debug("hotkey: {} ({})", kind == HotkeyEventKind::TransmissionStarted ? "started" : "triggered",
                   to_string(mode));
        emit(*kind, mode);
    }
    return true;
}

bool HotkeyStateMachine::on_key_up(KeyId key) {
    TransmissionMode ended = TransmissionMode::None;
    bool suppress = false;

    {
        std::lock_guard lock(mutex_);

        if (keys::is_modifier(key)) {
            modifiers_.erase(key);
            return false;
        }

        suppress = suppressed_downs_.erase(key) > 0;

        if (active_ && release_matches_locked(key)) {
            ended = active_->mode;
            active_.reset();
            suppress = true;
        }
    }

    if (ended != TransmissionMode::None) {
        log_.debug("hotkey: ended ({})", to_string(ended));
        emit(HotkeyEventKind::TransmissionEnded, ended);
    }
    return suppress;
}

std::optional<TransmissionMode> HotkeyStateMachine::abandon() {
    std::lock_guard lock(mutex_);
    suppressed_downs_.clear();
    if (!active_) return std::nullopt;

    auto mode = active_->mode;
    active_.reset();
    return mode;
}

void HotkeyStateMachine::set_bindings(HotkeyBindings bindings) {
    std::lock_guard lock(mutex_);
    bindings_ = bindings;
}

void HotkeyStateMachine::set_tts_debounce(std::chrono::milliseconds window) {
    std::lock_guard lock(mutex_);
    tts_debounce_ = window;
}

TransmissionMode HotkeyStateMachine::active_mode() const {
    std::lock_guard lock(mutex_);
    return active_ ? active_->mode : TransmissionMode::None;
}

bool HotkeyStateMachine::modifier_held(keys::Modifier mod) const {
    std::lock_guard lock(mutex_);
    return held_locked(mod);
}

bool HotkeyStateMachine::held_locked(keys::Modifier mod) const {
    for (KeyId k : modifiers_) {
        if (keys::modifier_of(k) == mod) return true;
    }
    return false;
}

bool HotkeyStateMachine::try_start_locked(TransmissionMode mode, KeyId key) {
    if (active_) return false;
    active_ = Active{mode, key};
    return true;
}

bool HotkeyStateMachine::release_matches_locked(KeyId key) const {
    if (key != active_->key) return false;

    // Ctrl + Trigger-1 is the TTS trigger, so a Trigger-1 release with Control
    // held never ends a plain capture.
    if (active_->mode == TransmissionMode::Plain) {
        return !held_locked(keys::Modifier::Control);
    }
    return true;
}

void HotkeyStateMachine::emit(HotkeyEventKind kind, TransmissionMode mode) {
    std::vector<Listener> listeners;
    {
        std::lock_guard lock(listeners_mutex_);
        listeners = listeners_;
    }

    HotkeyEvent ev{kind, mode, clock_()};
    for (auto& l : listeners) {
        l(ev);
    }
}
