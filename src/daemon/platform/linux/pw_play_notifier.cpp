#include "platform/linux/pw_play_notifier.hpp"
#include "platform/linux/subprocess.hpp"

#include <filesystem>
#include <format>

PwPlayNotifier::PwPlayNotifier(SettingsSource& settings) : settings_(settings) {}

std::expected<void, std::string> PwPlayNotifier::play(NotificationKind /*kind*/) {
    auto cfg = settings_.current();
    const auto& n = cfg->notifications;
    if (n.sound_file.empty()) return std::unexpected("no sound_file configured");

    std::error_code ec;
    if (!std::filesystem::exists(n.sound_file, ec)) {
        return std::unexpected(std::format("sound file {} not found", n.sound_file));
    }

    auto res = platform::run_process(
        {"pw-play", "--volume", std::format("{:.2f}", n.volume), n.sound_file});
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected("pw-play exited with code " + std::to_string(res->exit_code));
    }
    return {};
}
