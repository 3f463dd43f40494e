#pragma once

#include "output/clipboard_sink.hpp"

// Clipboard through wl-clipboard (wl-copy / wl-paste).
class WaylandClipboard : public ClipboardSink {
public:
    std::expected<void, std::string> set_text(const std::string& text) override;
    std::expected<std::string, std::string> get_text() override;
};
