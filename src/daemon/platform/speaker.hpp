#pragma once

#include <expected>
#include <string>

// Text-to-speech output.
class Speaker {
public:
    virtual ~Speaker() = default;
    virtual std::expected<void, std::string> speak(const std::string& text) = 0;
};
