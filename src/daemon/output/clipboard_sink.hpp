#pragma once

#include <expected>
#include <string>

class ClipboardSink {
public:
    virtual ~ClipboardSink() = default;
    virtual std::expected<void, std::string> set_text(const std::string& text) = 0;
    // Empty string when the clipboard holds no text.
    virtual std::expected<std::string, std::string> get_text() = 0;
};
