#include "config.hpp"

#include "hotkey/keys.hpp"
#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read(const json& obj, const char* key, T& out) {
    if (obj.contains(key)) out = obj[key].get<T>();
}

template <typename T>
void clamp_field(std::vector<std::string>& notes, const char* name, T& value, T lo, T hi) {
    T clamped = std::clamp(value, lo, hi);
    if (clamped != value) {
        notes.push_back(std::format("{} {} out of range, using {}", name, value, clamped));
        value = clamped;
    }
}

} // namespace

const char* to_string(LlmProvider provider) {
    switch (provider) {
        case LlmProvider::OpenRouter: return "OpenRouter";
        case LlmProvider::Ollama: return "Ollama";
    }
    return "unknown";
}

std::vector<std::string> Config::validate() {
    std::vector<std::string> notes;

    for (auto* key : {&hotkeys.trigger1, &hotkeys.trigger2, &hotkeys.trigger3}) {
        if (!keys::from_name(*key)) {
            notes.push_back(std::format("unknown key name '{}'", *key));
        }
    }
    Hotkeys defaults;
    if (!keys::from_name(hotkeys.trigger1)) hotkeys.trigger1 = defaults.trigger1;
    if (!keys::from_name(hotkeys.trigger2)) hotkeys.trigger2 = defaults.trigger2;
    if (!keys::from_name(hotkeys.trigger3)) hotkeys.trigger3 = defaults.trigger3;

    if (whisper.api_format != "whisper.cpp" && whisper.api_format != "openai") {
        notes.push_back(std::format("unknown whisper api_format '{}'", whisper.api_format));
        whisper.api_format = "whisper.cpp";
    }

    clamp_field(notes, "notifications.volume", notifications.volume, 0.0, 1.0);
    clamp_field(notes, "openrouter.temperature", openrouter.temperature, 0.0, 2.0);
    clamp_field(notes, "ollama.temperature", ollama.temperature, 0.0, 2.0);
    clamp_field(notes, "openrouter.max_tokens", openrouter.max_tokens, 1, 4000);
    clamp_field(notes, "ollama.max_tokens", ollama.max_tokens, 1, 4000);
    clamp_field(notes, "vision.max_tokens", vision.max_tokens, 100, 4000);
    clamp_field(notes, "hotkeys.restart_base_ms", hotkeys.restart_base_ms, 50, 60000);
    clamp_field(notes, "hotkeys.max_restarts", hotkeys.max_restarts, 0, 20);
    clamp_field(notes, "hotkeys.tts_debounce_ms", hotkeys.tts_debounce_ms, 0, 5000);
    clamp_field(notes, "history.retention_days", history.retention_days, 0, 3650);
    clamp_field(notes, "audio.sample_rate", audio.sample_rate, 8000, 48000);
    clamp_field(notes, "audio.settle_ms", audio.settle_ms, 0, 10000);

    if (notifications.enabled && notifications.sound_file.empty()) {
        notes.push_back("notifications enabled without sound_file, disabling");
        notifications.enabled = false;
    }

    return notes;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("hotkeys")) {
            auto& h = j["hotkeys"];
            read(h, "trigger1", cfg.hotkeys.trigger1);
            read(h, "trigger2", cfg.hotkeys.trigger2);
            read(h, "trigger3", cfg.hotkeys.trigger3);
            read(h, "device", cfg.hotkeys.device);
            read(h, "restart_base_ms", cfg.hotkeys.restart_base_ms);
            read(h, "max_restarts", cfg.hotkeys.max_restarts);
            read(h, "tts_debounce_ms", cfg.hotkeys.tts_debounce_ms);
        }

        if (j.contains("whisper")) {
            auto& w = j["whisper"];
            read(w, "url", cfg.whisper.url);
            read(w, "api_format", cfg.whisper.api_format);
            read(w, "language", cfg.whisper.language);
            read(w, "model", cfg.whisper.model);
        }

        if (j.contains("llm")) {
            std::string provider = j["llm"].value("provider", "openrouter");
            if (provider == "ollama") {
                cfg.provider = LlmProvider::Ollama;
            } else if (provider == "openrouter") {
                cfg.provider = LlmProvider::OpenRouter;
            } else {
                std::println(stderr, "config: unknown llm provider '{}', using openrouter", provider);
            }
        }

        if (j.contains("openrouter")) {
            auto& o = j["openrouter"];
            read(o, "api_key", cfg.openrouter.api_key);
            read(o, "base_url", cfg.openrouter.base_url);
            read(o, "model", cfg.openrouter.model);
            read(o, "system_prompt", cfg.openrouter.system_prompt);
            read(o, "temperature", cfg.openrouter.temperature);
            read(o, "max_tokens", cfg.openrouter.max_tokens);
            read(o, "timeout_s", cfg.openrouter.timeout_s);
        }

        if (j.contains("ollama")) {
            auto& o = j["ollama"];
            read(o, "url", cfg.ollama.url);
            read(o, "model", cfg.ollama.model);
            read(o, "system_prompt", cfg.ollama.system_prompt);
            read(o, "temperature", cfg.ollama.temperature);
            read(o, "max_tokens", cfg.ollama.max_tokens);
            read(o, "timeout_s", cfg.ollama.timeout_s);
        }

        if (j.contains("vision")) {
            auto& v = j["vision"];
            read(v, "system_prompt", cfg.vision.system_prompt);
            read(v, "max_tokens", cfg.vision.max_tokens);
            read(v, "enabled", cfg.vision.enabled);
        }

        if (j.contains("notifications")) {
            auto& n = j["notifications"];
            read(n, "enabled", cfg.notifications.enabled);
            read(n, "sound_file", cfg.notifications.sound_file);
            read(n, "volume", cfg.notifications.volume);
            read(n, "on_speech_to_text", cfg.notifications.on_speech_to_text);
            read(n, "on_llm_response", cfg.notifications.on_llm_response);
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            read(h, "enabled", cfg.history.enabled);
            read(h, "retain_recordings", cfg.history.retain_recordings);
            read(h, "retention_days", cfg.history.retention_days);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read(a, "sample_rate", cfg.audio.sample_rate);
            read(a, "settle_ms", cfg.audio.settle_ms);
        }

        if (j.contains("tts")) {
            auto& t = j["tts"];
            read(t, "command", cfg.tts.command);
            read(t, "voice", cfg.tts.voice);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    for (const auto& note : cfg.validate()) {
        std::println(stderr, "config: {}", note);
    }

    return cfg;
}

std::string Config::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "config.json").string();
}
