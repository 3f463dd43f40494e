#include "pipeline/pipeline_orchestrator.hpp"

#include <filesystem>
#include <format>
#include <thread>
#include <utility>

namespace fs = std::filesystem;
using namespace std::chrono;

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Removes the recording when the transmission is done with it, wherever the
// pipeline stopped.
class ArtifactGuard {
public:
    ArtifactGuard(std::string path, bool retain, Logger& log)
        : path_(std::move(path)), retain_(retain), log_(log) {}

    ~ArtifactGuard() {
        if (retain_ || path_.empty()) return;
        std::error_code ec;
        if (fs::remove(path_, ec)) {
            log_.debug("removed {}", path_);
        } else if (ec) {
            log_.warn("failed to remove {}: {}", path_, ec.message());
        }
    }

    ArtifactGuard(const ArtifactGuard&) = delete;
    ArtifactGuard& operator=(const ArtifactGuard&) = delete;

private:
    std::string path_;
    bool retain_;
    Logger& log_;
};

milliseconds since(steady_clock::time_point start) {
    return duration_cast<milliseconds>(steady_clock::now() - start);
}

double seconds_since(steady_clock::time_point start) {
    return duration<double>(steady_clock::now() - start).count();
}

} // namespace

PipelineOrchestrator::PipelineOrchestrator(PipelineCollaborators collaborators,
                                           SettingsSource& settings, WorkPool& pool,
                                           MainThreadDispatcher& dispatcher, Logger& log,
                                           std::string temp_dir)
    : c_(collaborators), settings_(settings), pool_(pool), dispatcher_(dispatcher),
      log_(log), temp_dir_(std::move(temp_dir)), config_(settings.current()) {
    settings_sub_ = settings_.subscribe([this](const SettingsSource::Snapshot& cfg) {
        std::lock_guard lock(mutex_);
        config_ = cfg;
    });
}

PipelineOrchestrator::~PipelineOrchestrator() {
    settings_.unsubscribe(settings_sub_);
}

void PipelineOrchestrator::attach(HotkeyStateMachine& machine) {
    machine.subscribe([this](const HotkeyEvent& ev) { on_hotkey_event(ev); });
}

void PipelineOrchestrator::on_hotkey_event(const HotkeyEvent& event) {
    switch (event.kind) {
        case HotkeyEventKind::TransmissionStarted:
            begin_recording(event.mode, event.at);
            break;
        case HotkeyEventKind::TransmissionEnded:
            end_recording(event.mode);
            break;
        case HotkeyEventKind::TtsTriggered: {
            auto cfg = snapshot();
            submit(TransmissionMode::TtsImmediate,
                   [this, cfg, at = event.at] { run_tts(cfg, at); });
            break;
        }
        case HotkeyEventKind::VisionCaptureStarted: {
            auto cfg = snapshot();
            submit(TransmissionMode::VisionImmediate,
                   [this, cfg, at = event.at] { run_vision_immediate(cfg, at); });
            break;
        }
    }
}

void PipelineOrchestrator::subscribe_completed(CompletedListener listener) {
    std::lock_guard lock(listeners_mutex_);
    completed_listeners_.push_back(std::move(listener));
}

void PipelineOrchestrator::subscribe_error(ErrorListener listener) {
    std::lock_guard lock(listeners_mutex_);
    error_listeners_.push_back(std::move(listener));
}

bool PipelineOrchestrator::is_recording() const {
    std::lock_guard lock(mutex_);
    return recording_ != nullptr;
}

SettingsSource::Snapshot PipelineOrchestrator::snapshot() const {
    std::lock_guard lock(mutex_);
    return config_;
}

void PipelineOrchestrator::begin_recording(TransmissionMode mode,
                                           steady_clock::time_point at) {
    auto tx = std::make_shared<Transmission>();
    tx->mode = mode;
    tx->started = at;

    // A transmission abandoned by a listener restart never got its Ended event.
    discard_recording();

    {
        std::lock_guard lock(mutex_);
        tx->config = config_;
        tx->audio_path = std::format("{}/holdtalk_recording_{}_{}.wav", temp_dir_,
                                     timestamp_now(), ++seq_);
    }

    if (mode == TransmissionMode::CopyPrompt) {
        auto promise = std::make_shared<std::promise<std::string>>();
        tx->clipboard = promise->get_future().share();
        dispatcher_.post([this, promise] {
            auto text = c_.clipboard.get_text();
            if (!text) {
                log_.warn("clipboard read failed: {}", text.error());
                promise->set_value({});
                return;
            }
            promise->set_value(std::move(*text));
        });
    }

    auto started = c_.audio.start(tx->audio_path);
    if (!started) {
        ArtifactGuard discard(tx->audio_path, false, log_);
        emit_error(mode, "Failed to start recording", started.error());
        return;
    }

    {
        std::lock_guard lock(mutex_);
        recording_ = tx;
    }
    log_.info("recording {} to {}", to_string(mode), tx->audio_path);
}

bool PipelineOrchestrator::discard_recording() {
    std::shared_ptr<Transmission> orphan;
    {
        std::lock_guard lock(mutex_);
        orphan = std::move(recording_);
    }
    if (!orphan) return false;

    log_.warn("discarding recording of abandoned {} transmission", to_string(orphan->mode));
    if (auto stopped = c_.audio.stop(); !stopped) {
        log_.warn("stop recording: {}", stopped.error());
    }
    ArtifactGuard discard(orphan->audio_path, false, log_);
    return true;
}

void PipelineOrchestrator::end_recording(TransmissionMode mode) {
    std::shared_ptr<Transmission> tx;
    {
        std::lock_guard lock(mutex_);
        if (!recording_ || recording_->mode != mode) {
            log_.debug("{} ended with no recording in progress", to_string(mode));
            return;
        }
        tx = std::move(recording_);
    }

    if (auto stopped = c_.audio.stop(); !stopped) {
        log_.warn("stop recording: {}", stopped.error());
    }

    if (!submit(mode, [this, tx] { run_capture(tx); })) {
        ArtifactGuard discard(tx->audio_path, tx->config->history.retain_recordings, log_);
    }
}

void PipelineOrchestrator::run_capture(const std::shared_ptr<Transmission>& tx) {
    const Config& cfg = *tx->config;
    const TransmissionMode mode = tx->mode;
    ArtifactGuard artifact(tx->audio_path, cfg.history.retain_recordings, log_);

    if (cfg.audio.settle_ms > 0) {
        std::this_thread::sleep_for(milliseconds(cfg.audio.settle_ms));
    }

    std::error_code ec;
    if (!fs::exists(tx->audio_path, ec)) {
        emit_error(mode, "Recording file not found", tx->audio_path);
        return;
    }

    auto transcript = c_.transcriber.transcribe(tx->audio_path);
    if (!transcript) {
        emit_error(mode, "Transcription failed", transcript.error());
        return;
    }

    std::string text = trim(transcript->text);
    if (text.empty()) {
        emit_error(mode, "No speech detected");
        return;
    }
    log_.info("transcribed {} chars ({})", text.size(), to_string(mode));

    HistoryEntry entry;
    entry.mode = to_string(mode);
    entry.text = text;
    entry.language = transcript->language;
    entry.models = std::format("Whisper:{}", cfg.whisper.model);
    if (cfg.history.retain_recordings) entry.audio_path = tx->audio_path;

    PipelineResult result;
    result.mode = mode;
    result.transcript = text;
    result.language = transcript->language;

    switch (mode) {
        case TransmissionMode::Plain: {
            deliver(text);
            notify(cfg, NotificationKind::SpeechToText);
            entry.duration = seconds_since(tx->started);
            persist(cfg, std::move(entry));
            result.text = text;
            result.duration = since(tx->started);
            emit_completed(result);
            return;
        }

        case TransmissionMode::Prompt:
        case TransmissionMode::CopyPrompt: {
            std::string prompt = text;
            std::string header = std::format("INPUT: {}", text);
            if (mode == TransmissionMode::CopyPrompt) {
                std::string clipboard = clipboard_snapshot(*tx);
                if (!clipboard.empty()) prompt = std::format("{}, {}", text, clipboard);
                header = std::format("SPEECH: {}\n\nCLIPBOARD: {}\n\nCOMBINED: {}",
                                     text, clipboard, prompt);
            }

            auto llm = augment(cfg, prompt);
            entry.models += std::format(" + {}:{}", llm.provider, llm.model);

            if (llm.error.empty()) {
                deliver(llm.response);
                notify(cfg, NotificationKind::LlmResponse);
                entry.text = std::format("{}\n\nLLM RESPONSE: {}", header, llm.response);
                entry.llm_response = llm.response;
                entry.duration = seconds_since(tx->started);
                persist(cfg, std::move(entry));
                result.text = llm.response;
                result.duration = since(tx->started);
                emit_completed(result);
            } else {
                deliver(text);
                notify(cfg, NotificationKind::SpeechToText);
                entry.text = std::format("{}\n\nLLM ERROR: {}", header, llm.error);
                entry.duration = seconds_since(tx->started);
                persist(cfg, std::move(entry));
                emit_error(mode, "LLM processing failed", llm.error);
            }
            return;
        }

        case TransmissionMode::VisionHold: {
            auto vision = describe(cfg, text);
            entry.models += std::format(" + Vision:{}", vision.provider);

            if (vision.error.empty()) {
                deliver(vision.response);
                notify(cfg, NotificationKind::LlmResponse);
                entry.text = std::format("SPEECH: {}\n\nVISION: {}", text, vision.response);
                entry.llm_response = vision.response;
                entry.duration = seconds_since(tx->started);
                persist(cfg, std::move(entry));
                result.text = vision.response;
                result.duration = since(tx->started);
                emit_completed(result);
            } else {
                deliver(text);
                notify(cfg, NotificationKind::SpeechToText);
                entry.text = std::format("SPEECH: {}\n\nVISION ERROR: {}", text, vision.error);
                entry.duration = seconds_since(tx->started);
                persist(cfg, std::move(entry));
                emit_error(mode, "Vision processing failed", vision.error);
            }
            return;
        }

        default:
            log_.error("{} is not a recording mode", to_string(mode));
            return;
    }
}

void PipelineOrchestrator::run_vision_immediate(SettingsSource::Snapshot cfg,
                                                steady_clock::time_point started) {
    auto vision = describe(*cfg, cfg->vision.system_prompt);
    if (!vision.error.empty()) {
        emit_error(TransmissionMode::VisionImmediate, "Vision capture failed", vision.error);
        return;
    }

    deliver(vision.response);
    notify(*cfg, NotificationKind::LlmResponse);

    PipelineResult result;
    result.mode = TransmissionMode::VisionImmediate;
    result.text = vision.response;
    result.duration = since(started);
    emit_completed(result);
}

void PipelineOrchestrator::run_tts(SettingsSource::Snapshot cfg,
                                   steady_clock::time_point started) {
    std::expected<std::string, std::string> clip = std::unexpected("clipboard not read");
    try {
        dispatcher_.invoke([&] { clip = c_.clipboard.get_text(); });
    } catch (const std::exception& e) {
        clip = std::unexpected(e.what());
    }
    if (!clip) {
        emit_error(TransmissionMode::TtsImmediate, "Failed to read clipboard", clip.error());
        return;
    }

    std::string text = trim(*clip);
    if (text.empty()) {
        emit_error(TransmissionMode::TtsImmediate, "Clipboard is empty");
        return;
    }

    log_.info("speaking {} chars with {}", text.size(), cfg->tts.command);
    if (auto spoken = c_.speaker.speak(text); !spoken) {
        emit_error(TransmissionMode::TtsImmediate, "Speech synthesis failed", spoken.error());
        return;
    }

    PipelineResult result;
    result.mode = TransmissionMode::TtsImmediate;
    result.text = text;
    result.duration = since(started);
    emit_completed(result);
}

PipelineOrchestrator::Augmented PipelineOrchestrator::augment(const Config& cfg,
                                                              const std::string& prompt) {
    const bool ollama = cfg.provider == LlmProvider::Ollama;
    LlmClient& client = ollama ? c_.ollama : c_.openrouter;

    Augmented out;
    out.provider = client.name();
    out.model = ollama ? cfg.ollama.model : cfg.openrouter.model;
    const std::string& system_prompt =
        ollama ? cfg.ollama.system_prompt : cfg.openrouter.system_prompt;

    if (!client.is_configured()) {
        out.error = std::format("{} is not configured", out.provider);
        return out;
    }

    try {
        auto response = client.complete(prompt, system_prompt, out.model);
        if (!response) {
            out.error = std::format("{} processing failed: {}", out.provider, response.error());
        } else if (trim(*response).empty()) {
            out.error = std::format("{} returned an empty response", out.provider);
        } else {
            out.response = trim(*response);
        }
    } catch (const std::exception& e) {
        out.error = std::format("{} processing failed: {}", out.provider, e.what());
    }
    return out;
}

PipelineOrchestrator::Augmented PipelineOrchestrator::describe(const Config& cfg,
                                                               const std::string& prompt) {
    const bool ollama = cfg.provider == LlmProvider::Ollama;
    LlmClient& client = ollama ? c_.ollama : c_.openrouter;

    Augmented out;
    out.provider = client.name();
    out.model = ollama ? cfg.ollama.model : cfg.openrouter.model;

    if (!cfg.vision.enabled) {
        out.error = "vision is disabled";
        return out;
    }
    if (!client.is_configured()) {
        out.error = std::format("{} is not configured", out.provider);
        return out;
    }

    auto png = c_.screen.capture_region();
    if (!png) {
        out.error = png.error();
        return out;
    }
    log_.debug("captured {} byte screenshot", png->size());

    try {
        auto response = client.describe_image(*png, prompt, out.model);
        if (!response) {
            out.error = std::format("{} vision request failed: {}", out.provider, response.error());
        } else if (trim(*response).empty()) {
            out.error = std::format("{} returned an empty response", out.provider);
        } else {
            out.response = trim(*response);
        }
    } catch (const std::exception& e) {
        out.error = std::format("{} vision request failed: {}", out.provider, e.what());
    }
    return out;
}

std::string PipelineOrchestrator::clipboard_snapshot(const Transmission& tx) {
    if (!tx.clipboard.valid()) return {};
    if (tx.clipboard.wait_for(seconds(2)) != std::future_status::ready) {
        log_.warn("clipboard snapshot not available, prompting without it");
        return {};
    }
    try {
        return tx.clipboard.get();
    } catch (const std::future_error& e) {
        log_.warn("clipboard snapshot lost: {}", e.what());
        return {};
    }
}

void PipelineOrchestrator::deliver(const std::string& text) {
    std::expected<void, std::string> set = std::unexpected("clipboard not written");
    try {
        dispatcher_.invoke([&] { set = c_.clipboard.set_text(text); });
    } catch (const std::exception& e) {
        set = std::unexpected(e.what());
    }
    if (!set) {
        log_.error("clipboard: {}", set.error());
        return;
    }
    log_.debug("copied {} chars to clipboard", text.size());
}

void PipelineOrchestrator::notify(const Config& cfg, NotificationKind kind) {
    if (!cfg.notifications.enabled) return;
    bool wanted = kind == NotificationKind::SpeechToText ? cfg.notifications.on_speech_to_text
                                                         : cfg.notifications.on_llm_response;
    if (!wanted) return;

    try {
        if (auto played = c_.notifier.play(kind); !played) {
            log_.warn("notification: {}", played.error());
        }
    } catch (const std::exception& e) {
        log_.warn("notification: {}", e.what());
    }
}

void PipelineOrchestrator::persist(const Config& cfg, HistoryEntry entry) {
    if (!cfg.history.enabled) return;
    if (auto appended = c_.history.append(entry); !appended) {
        log_.error("history: {}", appended.error());
    }
}

bool PipelineOrchestrator::submit(TransmissionMode mode, std::function<void()> job) {
    ++in_flight_;
    bool queued = pool_.submit([this, mode, job = std::move(job)] {
        try {
            job();
        } catch (const std::exception& e) {
            emit_error(mode, "Pipeline failed", e.what());
        }
        --in_flight_;
    });
    if (!queued) {
        --in_flight_;
        log_.warn("work pool is shut down, dropping {} pipeline", to_string(mode));
    }
    return queued;
}

std::string PipelineOrchestrator::timestamp_now() {
    auto now = system_clock::now();
    auto secs = floor<seconds>(now);
    auto ms = duration_cast<milliseconds>(now - secs).count();
    return std::format("{:%Y%m%d_%H%M%S}_{:03}", secs, ms);
}

void PipelineOrchestrator::emit_completed(const PipelineResult& result) {
    log_.info("{} completed in {} ms", to_string(result.mode), result.duration.count());

    std::vector<CompletedListener> listeners;
    {
        std::lock_guard lock(listeners_mutex_);
        listeners = completed_listeners_;
    }
    for (auto& l : listeners) l(result);
}

void PipelineOrchestrator::emit_error(TransmissionMode mode, std::string message,
                                      std::optional<std::string> cause) {
    if (cause) {
        log_.error("{}: {}: {}", to_string(mode), message, *cause);
    } else {
        log_.error("{}: {}", to_string(mode), message);
    }

    PipelineError err{mode, std::move(message), std::move(cause)};

    std::vector<ErrorListener> listeners;
    {
        std::lock_guard lock(listeners_mutex_);
        listeners = error_listeners_;
    }
    for (auto& l : listeners) l(err);
}
