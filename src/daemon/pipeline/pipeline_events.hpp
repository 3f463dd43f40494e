#pragma once

#include "hotkey/hotkey_state_machine.hpp"

#include <chrono>
#include <optional>
#include <string>

struct PipelineResult {
    TransmissionMode mode = TransmissionMode::None;
    std::string text;       // what was delivered to the clipboard or spoken
    std::string transcript; // empty for modes without speech input
    std::string language;
    std::chrono::milliseconds duration{0};
};

struct PipelineError {
    TransmissionMode mode = TransmissionMode::None;
    std::string message;
    std::optional<std::string> cause;
};
