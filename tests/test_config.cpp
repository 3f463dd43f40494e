#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "ht_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        if (::write(fd, content.data(), content.size()) < 0) path.clear();
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.hotkeys.trigger1 == "F1");
        REQUIRE(cfg.hotkeys.max_restarts == 3);
        REQUIRE(cfg.hotkeys.tts_debounce_ms == 200);
        REQUIRE(cfg.whisper.url == "http://localhost:8080");
        REQUIRE(cfg.whisper.api_format == "whisper.cpp");
        REQUIRE(cfg.provider == LlmProvider::OpenRouter);
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.audio.settle_ms == 1000);
        REQUIRE(cfg.history.enabled);
        REQUIRE_FALSE(cfg.history.retain_recordings);
        REQUIRE(cfg.vision.enabled);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "hotkeys": { "trigger1": "F9", "trigger2": "F10", "trigger3": "F11",
                         "max_restarts": 5, "tts_debounce_ms": 300 },
            "whisper": { "url": "http://10.0.0.1:9090", "api_format": "openai",
                         "language": "de", "model": "large-v3" },
            "llm": { "provider": "ollama" },
            "ollama": { "url": "http://gpu:11434", "model": "llama3", "temperature": 0.2 },
            "vision": { "max_tokens": 500, "enabled": false },
            "notifications": { "enabled": true, "sound_file": "/tmp/ding.wav", "volume": 0.8 },
            "history": { "retain_recordings": true, "retention_days": 7 },
            "audio": { "sample_rate": 48000, "settle_ms": 250 },
            "tts": { "command": "piper", "voice": "en_US" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.hotkeys.trigger1 == "F9");
        REQUIRE(cfg.hotkeys.trigger3 == "F11");
        REQUIRE(cfg.hotkeys.max_restarts == 5);
        REQUIRE(cfg.hotkeys.tts_debounce_ms == 300);
        REQUIRE(cfg.whisper.url == "http://10.0.0.1:9090");
        REQUIRE(cfg.whisper.api_format == "openai");
        REQUIRE(cfg.whisper.language == "de");
        REQUIRE(cfg.whisper.model == "large-v3");
        REQUIRE(cfg.provider == LlmProvider::Ollama);
        REQUIRE(cfg.ollama.model == "llama3");
        REQUIRE(cfg.ollama.temperature == 0.2);
        REQUIRE(cfg.vision.max_tokens == 500);
        REQUIRE_FALSE(cfg.vision.enabled);
        REQUIRE(cfg.notifications.enabled);
        REQUIRE(cfg.notifications.volume == 0.8);
        REQUIRE(cfg.history.retain_recordings);
        REQUIRE(cfg.history.retention_days == 7);
        REQUIRE(cfg.audio.sample_rate == 48000);
        REQUIRE(cfg.audio.settle_ms == 250);
        REQUIRE(cfg.tts.command == "piper");
        REQUIRE(cfg.tts.voice == "en_US");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "whisper": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.whisper.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.whisper.url == "http://localhost:8080");
        REQUIRE(cfg.hotkeys.trigger2 == "F2");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.whisper.api_format == "whisper.cpp");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/ht_test_nonexistent_config_file.json");
        REQUIRE(cfg.hotkeys.trigger1 == "F1");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("UnknownProviderKeepsDefault") {
        TmpFile f(R"({ "llm": { "provider": "gpt-local" } })");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.provider == LlmProvider::OpenRouter);
    }

    SECTION("ValidateClampsRanges") {
        Config cfg;
        cfg.notifications.volume = 3.0;
        cfg.openrouter.temperature = -1.0;
        cfg.vision.max_tokens = 10;
        cfg.hotkeys.trigger2 = "NotAKey";
        cfg.whisper.api_format = "grpc";

        auto notes = cfg.validate();
        REQUIRE(notes.size() == 5);
        REQUIRE(cfg.notifications.volume == 1.0);
        REQUIRE(cfg.openrouter.temperature == 0.0);
        REQUIRE(cfg.vision.max_tokens == 100);
        REQUIRE(cfg.hotkeys.trigger2 == "F2");
        REQUIRE(cfg.whisper.api_format == "whisper.cpp");
    }

    SECTION("ValidateClampsNegativeAndZeroCounts") {
        TmpFile f(R"({
            "hotkeys": { "max_restarts": -1, "restart_base_ms": 0, "tts_debounce_ms": -20 },
            "history": { "retention_days": -3 },
            "audio": { "sample_rate": 0, "settle_ms": -5 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.hotkeys.max_restarts == 0);
        REQUIRE(cfg.hotkeys.restart_base_ms == 50);
        REQUIRE(cfg.hotkeys.tts_debounce_ms == 0);
        REQUIRE(cfg.history.retention_days == 0);
        REQUIRE(cfg.audio.sample_rate == 8000);
        REQUIRE(cfg.audio.settle_ms == 0);
    }

    SECTION("ValidateCapsLargeValues") {
        Config cfg;
        cfg.hotkeys.max_restarts = 1000000;
        cfg.audio.sample_rate = 192000;
        auto notes = cfg.validate();
        REQUIRE(notes.size() == 2);
        REQUIRE(cfg.hotkeys.max_restarts == 20);
        REQUIRE(cfg.audio.sample_rate == 48000);
    }

    SECTION("NotificationsNeedSoundFile") {
        Config cfg;
        cfg.notifications.enabled = true;
        auto notes = cfg.validate();
        REQUIRE(notes.size() == 1);
        REQUIRE_FALSE(cfg.notifications.enabled);
    }

    SECTION("ValidConfigHasNoNotes") {
        Config cfg;
        REQUIRE(cfg.validate().empty());
    }
}
