#pragma once

#include "platform/speaker.hpp"
#include "settings_source.hpp"

// Speaks text by piping it to a TTS command (espeak-ng by default).
class CommandSpeaker : public Speaker {
public:
    explicit CommandSpeaker(SettingsSource& settings);

    std::expected<void, std::string> speak(const std::string& text) override;

private:
    SettingsSource& settings_;
};
