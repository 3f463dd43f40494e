#include "platform/linux/command_speaker.hpp"
#include "platform/linux/subprocess.hpp"

#include <filesystem>

CommandSpeaker::CommandSpeaker(SettingsSource& settings) : settings_(settings) {}

std::expected<void, std::string> CommandSpeaker::speak(const std::string& text) {
    auto cfg = settings_.current();
    const auto& tts = cfg->tts;
    if (tts.command.empty()) return std::unexpected("no tts command configured");

    std::vector<std::string> argv = {tts.command};
    if (!tts.voice.empty()) {
        argv.push_back("-v");
        argv.push_back(tts.voice);
    }
    if (std::filesystem::path(tts.command).filename().string().starts_with("espeak")) {
        argv.push_back("--stdin");
    }

    auto res = platform::run_process(argv, text);
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected(tts.command + " exited with code " + std::to_string(res->exit_code));
    }
    return {};
}
