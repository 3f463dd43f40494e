#pragma once

#include "settings_source.hpp"
#include "whisper/transcriber.hpp"

#include <string>

// Sends recordings to a whisper.cpp server or an OpenAI-compatible
// transcription endpoint on the LAN. Server settings are read per request.
class LanTranscriber : public Transcriber {
public:
    explicit LanTranscriber(SettingsSource& settings);

    std::expected<TranscriptResult, std::string> transcribe(const std::string& audio_path) override;

    // Parses a verbose_json (or plain json) transcription response.
    static std::expected<TranscriptResult, std::string> parse_response(const std::string& body);

private:
    SettingsSource& settings_;
};
