#pragma once

#include <expected>
#include <string>
#include <vector>

struct TranscriptSegment {
    double start_s = 0.0;
    double end_s = 0.0;
    std::string text;
};

struct TranscriptResult {
    std::string text;
    std::vector<TranscriptSegment> segments;
    std::string language;
    double processing_s = 0.0;
};

class Transcriber {
public:
    virtual ~Transcriber() = default;
    virtual std::expected<TranscriptResult, std::string> transcribe(const std::string& audio_path) = 0;
};
