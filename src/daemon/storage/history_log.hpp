#pragma once

#include <cstdint>
#include <expected>
#include <string>

struct HistoryEntry {
    int64_t id = 0;
    std::string timestamp;   // filled in by the store
    std::string mode;
    std::string text;
    std::string llm_response;
    std::string models;
    std::string language;
    double duration = 0.0;
    std::string audio_path;  // set only when the recording is retained
};

class HistoryLog {
public:
    virtual ~HistoryLog() = default;
    virtual std::expected<void, std::string> append(const HistoryEntry& entry) = 0;
};
