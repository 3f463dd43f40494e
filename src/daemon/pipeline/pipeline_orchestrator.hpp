#pragma once

#include "hotkey/hotkey_state_machine.hpp"
#include "llm/llm_client.hpp"
#include "log.hpp"
#include "output/clipboard_sink.hpp"
#include "pipeline/dispatcher.hpp"
#include "pipeline/pipeline_events.hpp"
#include "pipeline/work_pool.hpp"
#include "platform/audio_capture.hpp"
#include "platform/notification_player.hpp"
#include "platform/screen_capture.hpp"
#include "platform/speaker.hpp"
#include "settings_source.hpp"
#include "storage/history_log.hpp"
#include "whisper/transcriber.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct PipelineCollaborators {
    AudioCapture& audio;
    Transcriber& transcriber;
    LlmClient& openrouter;
    LlmClient& ollama;
    ClipboardSink& clipboard;
    NotificationPlayer& notifier;
    HistoryLog& history;
    Speaker& speaker;
    ScreenCapture& screen;
};

// Drives record -> transcribe -> augment -> deliver -> notify -> persist for
// each transmission reported by the hotkey state machine.
//
// Recording starts and stops on the key thread; everything after runs on the
// work pool. Clipboard access goes through the dispatcher.
class PipelineOrchestrator {
public:
    using CompletedListener = std::function<void(const PipelineResult&)>;
    using ErrorListener = std::function<void(const PipelineError&)>;

    PipelineOrchestrator(PipelineCollaborators collaborators, SettingsSource& settings,
                         WorkPool& pool, MainThreadDispatcher& dispatcher, Logger& log,
                         std::string temp_dir);
    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    void attach(HotkeyStateMachine& machine);
    void on_hotkey_event(const HotkeyEvent& event);

    // Listeners run on the thread that finished the stage, in registration order.
    void subscribe_completed(CompletedListener listener);
    void subscribe_error(ErrorListener listener);

    // Stops and deletes a recording whose transmission will never end.
    // Returns false if nothing was recording.
    bool discard_recording();

    bool is_recording() const;
    size_t in_flight() const { return in_flight_.load(); }

private:
    struct Transmission {
        TransmissionMode mode = TransmissionMode::None;
        std::chrono::steady_clock::time_point started;
        std::string audio_path;
        SettingsSource::Snapshot config;
        std::shared_future<std::string> clipboard; // CopyPrompt only
    };

    struct Augmented {
        std::string response;
        std::string error;
        std::string provider;
        std::string model;
    };

    SettingsSource::Snapshot snapshot() const;

    void begin_recording(TransmissionMode mode, std::chrono::steady_clock::time_point at);
    void end_recording(TransmissionMode mode);

    void run_capture(const std::shared_ptr<Transmission>& tx);
    void run_vision_immediate(SettingsSource::Snapshot cfg,
                              std::chrono::steady_clock::time_point started);
    void run_tts(SettingsSource::Snapshot cfg, std::chrono::steady_clock::time_point started);

    Augmented augment(const Config& cfg, const std::string& prompt);
    // Captures a screen region and asks the active provider about it.
    Augmented describe(const Config& cfg, const std::string& prompt);
    std::string clipboard_snapshot(const Transmission& tx);

    void deliver(const std::string& text);
    void notify(const Config& cfg, NotificationKind kind);
    void persist(const Config& cfg, HistoryEntry entry);

    bool submit(TransmissionMode mode, std::function<void()> job);
    static std::string timestamp_now();

    void emit_completed(const PipelineResult& result);
    void emit_error(TransmissionMode mode, std::string message,
                    std::optional<std::string> cause = std::nullopt);

    PipelineCollaborators c_;
    SettingsSource& settings_;
    WorkPool& pool_;
    MainThreadDispatcher& dispatcher_;
    Logger& log_;
    std::string temp_dir_;
    size_t settings_sub_ = 0;

    mutable std::mutex mutex_;
    SettingsSource::Snapshot config_;
    std::shared_ptr<Transmission> recording_;
    uint64_t seq_ = 0;

    std::atomic<size_t> in_flight_{0};

    std::mutex listeners_mutex_;
    std::vector<CompletedListener> completed_listeners_;
    std::vector<ErrorListener> error_listeners_;
};
