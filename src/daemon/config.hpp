#pragma once

#include <string>
#include <vector>

enum class LlmProvider { OpenRouter, Ollama };

struct Config {
    struct Hotkeys {
        std::string trigger1 = "F1";
        std::string trigger2 = "F2";
        std::string trigger3 = "F3";
        std::string device;          // empty: first keyboard found
        int restart_base_ms = 1000;
        int max_restarts = 3;
        int tts_debounce_ms = 200;
    } hotkeys;

    struct Whisper {
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "auto";
        std::string model = "base";
    } whisper;

    LlmProvider provider = LlmProvider::OpenRouter;

    struct OpenRouter {
        std::string api_key;
        std::string base_url = "https://openrouter.ai/api/v1";
        std::string model = "anthropic/claude-sonnet-4";
        std::string system_prompt =
            "You are a helpful assistant. Please provide a clear, concise response "
            "to the user's voice input.";
        double temperature = 0.7;
        int max_tokens = 1000;
        long timeout_s = 30;
    } openrouter;

    struct Ollama {
        std::string url = "http://localhost:11434";
        std::string model;
        std::string system_prompt =
            "You are a helpful assistant. Please provide a clear, concise response "
            "to the user's voice input.";
        double temperature = 0.7;
        int max_tokens = 1000;
        long timeout_s = 30;
    } ollama;

    struct Vision {
        std::string system_prompt = "Describe the image in a single line paragraph";
        int max_tokens = 1000;
        bool enabled = true;
    } vision;

    struct Notifications {
        bool enabled = false;
        std::string sound_file;
        double volume = 0.5;
        bool on_speech_to_text = true;
        bool on_llm_response = true;
    } notifications;

    struct History {
        bool enabled = true;
        bool retain_recordings = false;
        int retention_days = 30;
    } history;

    struct Audio {
        int sample_rate = 16000;
        int settle_ms = 1000;
    } audio;

    struct Tts {
        std::string command = "espeak-ng";
        std::string voice;
    } tts;

    // Clamps out-of-range values. Returns one message per correction.
    std::vector<std::string> validate();

    static Config load(const std::string& path);
    static std::string default_path();
};

const char* to_string(LlmProvider provider);
