#include "ipc_protocol.hpp"

namespace ipc {

namespace {

const char* event_name(HotkeyEventKind kind) {
    switch (kind) {
        case HotkeyEventKind::TransmissionStarted: return "transmission_started";
        case HotkeyEventKind::TransmissionEnded: return "transmission_ended";
        case HotkeyEventKind::TtsTriggered: return "tts_triggered";
        case HotkeyEventKind::VisionCaptureStarted: return "vision_capture_started";
    }
    return "unknown";
}

} // namespace

nlohmann::json event_json(const HotkeyEvent& event) {
    return {{"event", event_name(event.kind)}, {"mode", to_string(event.mode)}};
}

nlohmann::json event_json(const PipelineResult& result) {
    return {
        {"event", "pipeline_completed"},
        {"mode", to_string(result.mode)},
        {"text", result.text},
        {"transcript", result.transcript},
        {"language", result.language},
        {"duration_ms", result.duration.count()},
    };
}

nlohmann::json event_json(const PipelineError& error) {
    nlohmann::json j = {
        {"event", "pipeline_error"},
        {"mode", to_string(error.mode)},
        {"message", error.message},
    };
    if (error.cause) j["cause"] = *error.cause;
    return j;
}

nlohmann::json listener_failed_json(const std::string& reason) {
    return {{"event", "listener_failed"}, {"reason", reason}};
}

nlohmann::json entry_json(const HistoryEntry& e) {
    return {
        {"id", e.id},
        {"timestamp", e.timestamp},
        {"mode", e.mode},
        {"text", e.text},
        {"llm_response", e.llm_response},
        {"models", e.models},
        {"language", e.language},
        {"duration", e.duration},
        {"audio_path", e.audio_path},
    };
}

nlohmann::json ok() {
    return {{"status", "ok"}};
}

nlohmann::json error(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

} // namespace ipc
