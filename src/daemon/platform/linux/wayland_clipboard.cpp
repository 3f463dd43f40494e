#include "platform/linux/wayland_clipboard.hpp"
#include "platform/linux/subprocess.hpp"

std::expected<void, std::string> WaylandClipboard::set_text(const std::string& text) {
    auto res = platform::run_process({"wl-copy"}, text);
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected("wl-copy exited with code " + std::to_string(res->exit_code));
    }
    if (!res->input_consumed) return std::unexpected("wl-copy stopped reading its input");
    return {};
}

std::expected<std::string, std::string> WaylandClipboard::get_text() {
    auto res = platform::run_process({"wl-paste", "--no-newline", "--type", "text"}, {}, true);
    if (!res) return std::unexpected(res.error());
    // wl-paste exits 1 when the clipboard is empty or holds no text.
    if (res->exit_code == 1) return std::string{};
    if (res->exit_code != 0) {
        return std::unexpected("wl-paste exited with code " + std::to_string(res->exit_code));
    }
    return std::move(res->output);
}
