#pragma once

#include "hotkey/keys.hpp"

#include <expected>
#include <functional>
#include <string>

class KeyEventSource {
public:
    // Returns true to keep the event from reaching other applications.
    using KeyHandler = std::function<bool(KeyId)>;

    virtual ~KeyEventSource() = default;

    virtual void set_handlers(KeyHandler on_down, KeyHandler on_up) = 0;

    // Blocks delivering events until stop() (success) or until the source
    // dies (error). May be called again after it returns.
    virtual std::expected<void, std::string> run() = 0;

    // Safe to call from any thread.
    virtual void stop() = 0;
};
